#pragma once

#include <array>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

namespace bpack {

using sha256_t = std::array<unsigned char, 32>;

// Checksum mismatch. Never retried, never tolerated.
class integrity_error : public std::runtime_error {
 public:
  integrity_error(std::string const &message, std::string expected, std::string actual)
      : std::runtime_error{ message },
        expected_{ std::move(expected) },
        actual_{ std::move(actual) } {}

  std::string const &expected() const { return expected_; }
  std::string const &actual() const { return actual_; }

 private:
  std::string expected_;
  std::string actual_;
};

sha256_t sha256(std::filesystem::path const &file_path);

// Verify SHA256 hash matches expected hex string (case-insensitive)
// Throws integrity_error with both digests on mismatch, std::runtime_error if
// expected_hex is malformed.
void sha256_verify(std::string const &expected_hex, sha256_t const &actual_hash);

}  // namespace bpack
