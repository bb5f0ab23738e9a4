#include "md5.h"

#include "util.h"

#include <mbedtls/md5.h>

#include <stdexcept>

namespace bpack {

md5_t md5(std::string_view data) {
  md5_t digest{};
  if (mbedtls_md5(reinterpret_cast<unsigned char const *>(data.data()),
                  data.size(),
                  digest.data())) {
    throw std::runtime_error("md5: mbedtls_md5 failed");
  }
  return digest;
}

std::string md5_hex(std::string_view data) {
  auto const digest{ md5(data) };
  return util_bytes_to_hex(digest.data(), digest.size());
}

}  // namespace bpack
