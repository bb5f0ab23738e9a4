#pragma once

#include "uri.h"

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace bpack {

struct fetch_request_http {
  std::string source;
  std::filesystem::path destination;
};

struct fetch_request_https {
  std::string source;
  std::filesystem::path destination;
};

struct fetch_request_ftp {
  std::string source;
  std::filesystem::path destination;
};

struct fetch_request_ftps {
  std::string source;
  std::filesystem::path destination;
};

// Local file fetch request; relative sources resolve against file_root
struct fetch_request_file {
  std::string source;
  std::filesystem::path destination;
  std::filesystem::path file_root;
};

using fetch_request = std::variant<fetch_request_http,
                                   fetch_request_https,
                                   fetch_request_ftp,
                                   fetch_request_ftps,
                                   fetch_request_file>;

struct fetch_result {
  uri_scheme scheme;
  std::filesystem::path resolved_source;
  std::filesystem::path resolved_destination;
};

// Build the request matching `source`'s scheme. Throws std::invalid_argument for
// empty or unsupported sources.
fetch_request fetch_request_from_uri(std::string const &source,
                                     std::filesystem::path const &destination,
                                     std::optional<std::filesystem::path> const &file_root = {});

fetch_result fetch_single(fetch_request const &request);

}  // namespace bpack
