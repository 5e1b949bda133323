// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#include "util/files.hpp"

#include <cstdio>
#include <cstdlib>
#include <fcntl.h>
#include <fstream>
#include <random>
#include <unistd.h>

namespace devicelink {
namespace util {

namespace {

constexpr std::streamsize MAX_FILE_SIZE = 64 * 1024 * 1024;

bool sync_directory(const std::filesystem::path &dir) {
  int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0)
    return false;
  bool ok = fsync(fd) == 0;
  close(fd);
  return ok;
}

std::string random_suffix() {
  static thread_local std::mt19937 gen(std::random_device{}());
  static thread_local std::uniform_int_distribution<> dis(0, 0xFFFF);
  char buf[8];
  snprintf(buf, sizeof(buf), "%04x", dis(gen));
  return std::string(buf);
}

} // anonymous namespace

bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data, int mode) {
  auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    return false;
  }

  auto temp_path = path;
  temp_path += ".tmp." + random_suffix();

  int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, mode);
  if (fd < 0) {
    return false;
  }

  std::error_code ec;
  size_t total = 0;
  while (total < data.size()) {
    ssize_t n = write(fd, data.data() + total, data.size() - total);
    if (n <= 0) {
      close(fd);
      std::filesystem::remove(temp_path, ec);
      return false;
    }
    total += static_cast<size_t>(n);
  }

  if (fsync(fd) != 0) {
    close(fd);
    std::filesystem::remove(temp_path, ec);
    return false;
  }
  close(fd);

  if (!parent.empty() && !sync_directory(parent)) {
    std::filesystem::remove(temp_path, ec);
    return false;
  }

  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    std::filesystem::remove(temp_path, ec);
    return false;
  }
  return true;
}

std::string read_file_string(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file) {
    return {};
  }

  std::streampos pos = file.tellg();
  if (pos == std::streampos(-1)) {
    return {};
  }
  std::streamsize size = static_cast<std::streamsize>(pos);
  if (size <= 0 || size > MAX_FILE_SIZE) {
    return {};
  }

  std::string data(static_cast<size_t>(size), '\0');
  file.seekg(0);
  file.read(data.data(), size);
  if (!file) {
    return {};
  }
  return data;
}

bool ensure_directory(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec || std::filesystem::exists(dir);
}

std::filesystem::path get_default_datadir() {
  if (const char *home = std::getenv("HOME")) {
    return std::filesystem::path(home) / ".devicelink";
  }
  return std::filesystem::current_path() / ".devicelink";
}

} // namespace util
} // namespace devicelink
