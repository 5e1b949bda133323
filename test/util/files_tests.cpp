#include <catch2/catch_test_macros.hpp>
#include "util/files.hpp"
#include "util/time.hpp"
#include <filesystem>

using namespace devicelink::util;

TEST_CASE("File utilities", "[util][files]") {
    auto test_dir = std::filesystem::temp_directory_path() / "devicelink_files_test";
    std::filesystem::remove_all(test_dir);

    SECTION("ensure_directory creates directories") {
        auto subdir = test_dir / "sub" / "nested";
        REQUIRE(ensure_directory(subdir));
        REQUIRE(std::filesystem::is_directory(subdir));
    }

    SECTION("atomic_write_file creates parent and file") {
        auto file_path = test_dir / "a" / "inventory.json";
        REQUIRE(atomic_write_file(file_path, std::string("{\"nodes\":{}}")));
        REQUIRE(read_file_string(file_path) == "{\"nodes\":{}}");
    }

    SECTION("atomic_write_file overwrites and leaves no temp files") {
        auto file_path = test_dir / "state.json";
        REQUIRE(atomic_write_file(file_path, std::string("first")));
        REQUIRE(atomic_write_file(file_path, std::string("second")));
        REQUIRE(read_file_string(file_path) == "second");

        size_t entries = 0;
        for (const auto& entry : std::filesystem::directory_iterator(test_dir)) {
            (void)entry;
            ++entries;
        }
        REQUIRE(entries == 1);
    }

    SECTION("read_file_string returns empty on missing file") {
        REQUIRE(read_file_string(test_dir / "missing").empty());
    }

    SECTION("get_default_datadir ends in .devicelink") {
        REQUIRE(get_default_datadir().filename() == ".devicelink");
    }

    std::filesystem::remove_all(test_dir);
}

TEST_CASE("Mock time", "[util][time]") {
    {
        MockTimeScope scope(1700000000);
        REQUIRE(GetTime() == 1700000000);
        REQUIRE(FormatTime(GetTime()) == "2023-11-14 22:13:20 UTC");
    }
    REQUIRE(GetMockTime() == 0);
    REQUIRE(GetTime() > 1700000000);
}
