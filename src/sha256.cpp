#include "sha256.h"

#include "util.h"

#include <mbedtls/sha256.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <system_error>

namespace bpack {

namespace {

class sha256_context : unmovable {
 public:
  sha256_context() {
    mbedtls_sha256_init(&ctx_);
    check(mbedtls_sha256_starts(&ctx_, 0), "mbedtls_sha256_starts");
  }
  ~sha256_context() { mbedtls_sha256_free(&ctx_); }

  void update(unsigned char const *data, size_t size) {
    check(mbedtls_sha256_update(&ctx_, data, size), "mbedtls_sha256_update");
  }

  sha256_t finish() {
    sha256_t digest{};
    check(mbedtls_sha256_finish(&ctx_, digest.data()), "mbedtls_sha256_finish");
    return digest;
  }

 private:
  static void check(int rc, char const *what) {
    if (rc != 0) {
      throw std::runtime_error(std::string("sha256: ") + what + " failed (" +
                               std::to_string(rc) + ")");
    }
  }

  mbedtls_sha256_context ctx_;
};

}  // namespace

sha256_t sha256(std::filesystem::path const &file_path) {
  auto const file{ util_open_file(file_path, "rb") };
  if (!file) {
    throw std::system_error(errno,
                            std::generic_category(),
                            "sha256: cannot open " + file_path.string());
  }

  sha256_context ctx;
  std::array<unsigned char, 64 * 1024> chunk;
  size_t n{ 0 };
  while ((n = std::fread(chunk.data(), 1, chunk.size(), file.get())) > 0) {
    ctx.update(chunk.data(), n);
  }
  if (std::ferror(file.get())) {
    throw std::runtime_error("sha256: read error: " + file_path.string());
  }

  return ctx.finish();
}

void sha256_verify(std::string const &expected_hex, sha256_t const &actual_hash) {
  if (expected_hex.size() != actual_hash.size() * 2) {
    throw std::runtime_error(
        "sha256_verify: expected hex string must be 64 characters, got " +
        std::to_string(expected_hex.size()));
  }

  if (std::ranges::equal(util_hex_to_bytes(expected_hex), actual_hash)) { return; }

  auto const actual_hex{ util_bytes_to_hex(actual_hash.data(), actual_hash.size()) };
  throw integrity_error("SHA256 mismatch: expected " + expected_hex + " but got " +
                            actual_hex,
                        expected_hex,
                        actual_hex);
}

}  // namespace bpack
