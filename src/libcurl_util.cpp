#include "libcurl_util.h"

#include "tui.h"
#include "util.h"

#include <curl/curl.h>

#include <array>
#include <cstdio>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#ifndef BPACK_VERSION_STR
#error "BPACK_VERSION_STR must be defined by the build system"
#endif

namespace bpack {

namespace {

constexpr char kUserAgent[]{ "bpack-fetch/" BPACK_VERSION_STR };
constexpr long kConnectTimeoutSeconds{ 30 };

using curl_handle_t = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

size_t write_to_file(char *ptr, size_t size, size_t nmemb, void *userdata) {
  return std::fwrite(ptr, size, nmemb, static_cast<std::FILE *>(userdata)) * size;
}

template <typename T>
void set_option(CURL *handle, CURLoption option, T value) {
  if (CURLcode const rc{ curl_easy_setopt(handle, option, value) }; rc != CURLE_OK) {
    throw std::runtime_error(std::string("libcurl_download: curl_easy_setopt: ") +
                             curl_easy_strerror(rc));
  }
}

std::string describe_failure(CURL *handle, CURLcode rc, char const *error_buffer) {
  if (rc == CURLE_HTTP_RETURNED_ERROR) {
    long status{ 0 };
    if (curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status) == CURLE_OK &&
        status != 0) {
      return "could not download: " + std::to_string(status);
    }
  }
  return std::string("libcurl_download: ") +
         (error_buffer[0] ? error_buffer : curl_easy_strerror(rc));
}

}  // namespace

void libcurl_ensure_initialized() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (CURLcode const rc{ curl_global_init(CURL_GLOBAL_DEFAULT) }; rc != CURLE_OK) {
      throw std::runtime_error(std::string("curl_global_init failed: ") +
                               curl_easy_strerror(rc));
    }
  });
}

std::filesystem::path libcurl_download(std::string_view url,
                                       std::filesystem::path const &destination) {
  if (destination.empty()) {
    throw std::invalid_argument("libcurl_download: destination is empty");
  }
  libcurl_ensure_initialized();

  auto const dest{ std::filesystem::absolute(destination).lexically_normal() };
  std::filesystem::create_directories(dest.parent_path());

  scoped_path_cleanup partial{ dest };
  auto file{ util_open_file(dest, "wb") };
  if (!file) {
    throw std::runtime_error("libcurl_download: cannot open destination: " + dest.string());
  }

  curl_handle_t handle{ curl_easy_init(), &curl_easy_cleanup };
  if (!handle) { throw std::runtime_error("libcurl_download: curl_easy_init failed"); }

  std::string const url_str{ url };
  std::array<char, CURL_ERROR_SIZE> error_buffer{};

  CURL *const h{ handle.get() };
  set_option(h, CURLOPT_URL, url_str.c_str());
  set_option(h, CURLOPT_ERRORBUFFER, error_buffer.data());
  set_option(h, CURLOPT_FOLLOWLOCATION, 1L);
  set_option(h, CURLOPT_FAILONERROR, 1L);
  set_option(h, CURLOPT_NOSIGNAL, 1L);
  set_option(h, CURLOPT_CONNECTTIMEOUT, kConnectTimeoutSeconds);
  set_option(h, CURLOPT_NOPROGRESS, 1L);
  set_option(h, CURLOPT_USERAGENT, kUserAgent);
  set_option(h, CURLOPT_WRITEFUNCTION, write_to_file);
  set_option(h, CURLOPT_WRITEDATA, static_cast<void *>(file.get()));

  tui::debug("libcurl_download: GET %s -> %s", url_str.c_str(), dest.string().c_str());

  if (CURLcode const rc{ curl_easy_perform(h) }; rc != CURLE_OK) {
    throw std::runtime_error(describe_failure(h, rc, error_buffer.data()));
  }

  if (std::fflush(file.get()) != 0) {
    throw std::runtime_error("libcurl_download: failed to flush " + dest.string());
  }
  file.reset();

  partial.release();
  return dest;
}

}  // namespace bpack
