#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace devicelink {
namespace device {

// Translates raw protocol messages into the payload published to
// notification subscribers
class TranslatorLibrary {
public:
  virtual ~TranslatorLibrary() = default;

  // std::nullopt if the message cannot be translated for this version
  virtual std::optional<std::vector<uint8_t>>
  TranslatePacketIn(uint8_t version, const std::vector<uint8_t> &message) const = 0;
};

// Hands the raw packet-in payload through unchanged. Accepts every version.
class PassthroughTranslatorLibrary : public TranslatorLibrary {
public:
  std::optional<std::vector<uint8_t>>
  TranslatePacketIn(uint8_t, const std::vector<uint8_t> &message) const override {
    return message;
  }
};

// Registry of vendor extension converters, propagated to every device context
class ExtensionConverterProvider {
public:
  virtual ~ExtensionConverterProvider() = default;

  virtual bool HasConverter(uint32_t experimenter_id, uint8_t version) const = 0;
};

} // namespace device
} // namespace devicelink
