#include "fetch.h"

#include "libcurl_util.h"
#include "util.h"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>

namespace bpack {
namespace {

std::filesystem::path prepare_destination(std::filesystem::path destination) {
  if (destination.empty()) {
    throw std::invalid_argument("fetch: destination path is empty");
  }

  if (!destination.is_absolute()) { destination = std::filesystem::absolute(destination); }
  destination = destination.lexically_normal();

  if (auto const parent{ destination.parent_path() }; !parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw std::runtime_error("fetch: failed to create destination parent: " +
                               parent.string() + ": " + ec.message());
    }
  }

  return destination;
}

fetch_result fetch_local_file(std::string const &canonical_path,
                              std::filesystem::path const &destination,
                              std::filesystem::path const &file_root) {
  auto const source{ uri_resolve_local_file_relative(
      canonical_path,
      file_root.empty() ? std::nullopt : std::optional<std::filesystem::path>{ file_root }) };

  std::error_code ec;
  if (!std::filesystem::is_regular_file(source, ec)) {
    if (ec && ec != std::errc::no_such_file_or_directory) {
      throw std::runtime_error("fetch: failed to check source: " + source.string() + ": " +
                               ec.message());
    }
    throw std::runtime_error("fetch: source file does not exist: " + source.string());
  }

  auto const dest{ prepare_destination(destination) };

  std::filesystem::copy_file(source,
                             dest,
                             std::filesystem::copy_options::overwrite_existing,
                             ec);
  if (ec) {
    throw std::runtime_error("fetch: failed to copy file: " + source.string() + " -> " +
                             dest.string() + ": " + ec.message());
  }

  return fetch_result{ .scheme = uri_scheme::LOCAL_FILE_ABSOLUTE,
                       .resolved_source = source,
                       .resolved_destination = dest };
}

}  // namespace

fetch_request fetch_request_from_uri(std::string const &source,
                                     std::filesystem::path const &destination,
                                     std::optional<std::filesystem::path> const &file_root) {
  auto const info{ uri_classify(source) };
  switch (info.scheme) {
    case uri_scheme::HTTP:
      return fetch_request_http{ .source = source, .destination = destination };
    case uri_scheme::HTTPS:
      return fetch_request_https{ .source = source, .destination = destination };
    case uri_scheme::FTP:
      return fetch_request_ftp{ .source = source, .destination = destination };
    case uri_scheme::FTPS:
      return fetch_request_ftps{ .source = source, .destination = destination };
    case uri_scheme::LOCAL_FILE_ABSOLUTE:
    case uri_scheme::LOCAL_FILE_RELATIVE:
      return fetch_request_file{ .source = source,
                                 .destination = destination,
                                 .file_root = file_root.value_or(std::filesystem::path{}) };
    case uri_scheme::UNKNOWN: break;
  }

  if (info.canonical.empty()) { throw std::invalid_argument("fetch: source URI is empty"); }
  throw std::invalid_argument("fetch: unsupported URI scheme: " + source);
}

fetch_result fetch_single(fetch_request const &request) {
  auto const fetch_via_curl = [](auto const &req) -> fetch_result {
    auto const info{ uri_classify(req.source) };
    if (info.canonical.empty() && info.scheme == uri_scheme::UNKNOWN) {
      throw std::invalid_argument("fetch: source URI is empty");
    }
    auto const dest{ prepare_destination(req.destination) };
    return fetch_result{ .scheme = info.scheme,
                         .resolved_source = std::filesystem::path{ info.canonical },
                         .resolved_destination = libcurl_download(info.canonical, dest) };
  };

  return std::visit(
      match{
          [&](fetch_request_http const &req) { return fetch_via_curl(req); },
          [&](fetch_request_https const &req) { return fetch_via_curl(req); },
          [&](fetch_request_ftp const &req) { return fetch_via_curl(req); },
          [&](fetch_request_ftps const &req) { return fetch_via_curl(req); },
          [](fetch_request_file const &req) -> fetch_result {
            auto const info{ uri_classify(req.source) };
            if (info.canonical.empty() && info.scheme == uri_scheme::UNKNOWN) {
              throw std::invalid_argument("fetch: source URI is empty");
            }
            if (info.scheme != uri_scheme::LOCAL_FILE_ABSOLUTE &&
                info.scheme != uri_scheme::LOCAL_FILE_RELATIVE) {
              throw std::invalid_argument("fetch: not a local file: " + req.source);
            }
            return fetch_local_file(info.canonical, req.destination, req.file_root);
          },
      },
      request);
}

}  // namespace bpack
