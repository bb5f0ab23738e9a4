#include "uri.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <optional>
#include <ranges>
#include <stdexcept>
#include <string>
#include <string_view>

namespace bpack {
namespace {

constexpr auto to_lower = [](unsigned char c) { return std::tolower(c); };

std::string_view trim(std::string_view value) {
  auto const first{ value.find_first_not_of(" \t\n\r\f\v") };
  if (first == std::string_view::npos) { return {}; }

  auto const last{ value.find_last_not_of(" \t\n\r\f\v") };
  return value.substr(first, last - first + 1);
}

bool istarts_with(std::string_view value, std::string_view prefix) {
  if (prefix.size() > value.size()) { return false; }
  return std::ranges::equal(prefix,
                            value | std::views::take(prefix.size()),
                            {},
                            to_lower,
                            to_lower);
}

bool iequals(std::string_view lhs, std::string_view rhs) {
  return std::ranges::equal(lhs, rhs, {}, to_lower, to_lower);
}

std::string_view strip_query_and_fragment(std::string_view uri) {
  auto const pos{ uri.find_first_of("?#") };
  return pos == std::string_view::npos ? uri : uri.substr(0, pos);
}

// file:///abs, file://localhost/abs and file:relative all name local paths.
std::string strip_file_scheme(std::string_view uri) {
  std::string cand{ uri.substr(7) };

  if (!cand.empty() && cand[0] == '/') { return cand; }

  auto const slash{ cand.find('/') };
  if (slash == std::string::npos) { return cand; }

  std::string_view const host{ std::string_view{ cand }.substr(0, slash) };
  std::string_view const tail{ std::string_view{ cand }.substr(slash) };

  if (iequals(host, "localhost")) { return std::string{ tail }; }
  return cand;
}

struct remote_prefix {
  std::string_view prefix;
  uri_scheme scheme;
};

// https before http and ftps before ftp so the longer prefix wins.
constexpr std::array<remote_prefix, 4> kRemotePrefixes{ {
    { "https://", uri_scheme::HTTPS },
    { "http://", uri_scheme::HTTP },
    { "ftps://", uri_scheme::FTPS },
    { "ftp://", uri_scheme::FTP },
} };

}  // namespace

uri_info uri_classify(std::string_view value) {
  std::string canonical{ trim(value) };

  for (auto const &[prefix, scheme] : kRemotePrefixes) {
    if (istarts_with(canonical, prefix)) { return uri_info{ scheme, std::move(canonical) }; }
  }

  bool const file_scheme{ istarts_with(canonical, "file://") };
  if (!file_scheme && canonical.find("://") != std::string::npos) {
    return uri_info{ uri_scheme::UNKNOWN, std::move(canonical) };
  }

  std::string local{ file_scheme ? strip_file_scheme(canonical) : canonical };
  if (local.empty()) { return uri_info{ uri_scheme::UNKNOWN, std::move(canonical) }; }

  uri_scheme const scheme{ local.front() == '/' ? uri_scheme::LOCAL_FILE_ABSOLUTE
                                                : uri_scheme::LOCAL_FILE_RELATIVE };
  return uri_info{ scheme, std::move(local) };
}

std::filesystem::path uri_resolve_local_file_relative(
    std::string_view local_file,
    std::optional<std::filesystem::path> const &anchor) {
  auto const info{ uri_classify(local_file) };
  switch (info.scheme) {
    case uri_scheme::LOCAL_FILE_ABSOLUTE:
      return std::filesystem::path{ info.canonical }.lexically_normal();
    case uri_scheme::LOCAL_FILE_RELATIVE: {
      auto const base{ anchor && !anchor->empty() ? std::filesystem::absolute(*anchor)
                                                  : std::filesystem::current_path() };
      return (base / info.canonical).lexically_normal();
    }
    default:
      throw std::invalid_argument("uri_resolve_local_file_relative: not a local file: '" +
                                  std::string{ local_file } + "'");
  }
}

std::string uri_extract_filename(std::string_view uri) {
  auto const path{ strip_query_and_fragment(trim(uri)) };

  auto const scheme_end{ path.find("://") };
  auto const after_scheme{ scheme_end == std::string_view::npos
                               ? path
                               : path.substr(scheme_end + 3) };

  // host with no path component has no filename
  if (scheme_end != std::string_view::npos &&
      after_scheme.find('/') == std::string_view::npos) {
    return {};
  }

  auto const slash{ after_scheme.find_last_of('/') };
  if (slash == std::string_view::npos) { return std::string{ after_scheme }; }
  return std::string{ after_scheme.substr(slash + 1) };
}

}  // namespace bpack
