#include "rag_core/uuid_generator.hpp"

#include <array>

namespace rag_core {

namespace {
constexpr char HEX_DIGITS[] = "0123456789abcdef";
}

UuidGenerator::UuidGenerator() : engine_(std::random_device{}()) {}

UuidGenerator::UuidGenerator(std::uint64_t seed) : engine_(seed) {}

std::string UuidGenerator::generate() {
  std::array<std::uint8_t, 16> bytes;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < bytes.size(); i += 8) {
      std::uint64_t word = engine_();
      for (size_t j = 0; j < 8; ++j) {
        bytes[i + j] = static_cast<std::uint8_t>(word >> (j * 8));
      }
    }
  }

  // Version 4 in the high nibble of byte 6, RFC variant (10xx) in byte 8
  bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0f) | 0x40);
  bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3f) | 0x80);

  std::string out;
  out.reserve(36);
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out.push_back('-');
    }
    out.push_back(HEX_DIGITS[bytes[i] >> 4]);
    out.push_back(HEX_DIGITS[bytes[i] & 0x0f]);
  }
  return out;
}

bool UuidGenerator::is_valid(const std::string &uuid) {
  if (uuid.size() != 36) {
    return false;
  }
  for (size_t i = 0; i < uuid.size(); ++i) {
    const char c = uuid[i];
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (c != '-')
        return false;
      continue;
    }
    const bool is_hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    if (!is_hex)
      return false;
  }
  if (uuid[14] != '4') {
    return false;
  }
  const char variant = uuid[19];
  return variant == '8' || variant == '9' || variant == 'a' || variant == 'b';
}

}  // namespace rag_core
