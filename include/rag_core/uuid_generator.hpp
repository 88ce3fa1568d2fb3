#pragma once

#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace rag_core {

/**
 * @brief Generates RFC 4122 version 4 identifiers (8-4-4-4-12 lowercase hex).
 *
 * The bits come from a Mersenne Twister, not a cryptographic source, so uniqueness is
 * probabilistic only. Pass a fixed seed to get a reproducible sequence in tests.
 * Safe to share between stores and threads.
 */
class UuidGenerator {
 public:
  // Seeds from std::random_device
  UuidGenerator();
  explicit UuidGenerator(std::uint64_t seed);

  UuidGenerator(const UuidGenerator &) = delete;
  UuidGenerator &operator=(const UuidGenerator &) = delete;

  std::string generate();

  // Checks the textual layout and the version/variant nibbles
  static bool is_valid(const std::string &uuid);

 private:
  std::mt19937_64 engine_;
  std::mutex mutex_;
};

}  // namespace rag_core
