#pragma once

#include <array>
#include <string>
#include <string_view>

namespace bpack {

using md5_t = std::array<unsigned char, 16>;

md5_t md5(std::string_view data);

// Lowercase hex of md5(data); used to key cache entries by source URI.
std::string md5_hex(std::string_view data);

}  // namespace bpack
