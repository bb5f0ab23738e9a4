#include "zip_archive.h"

#include "platform.h"
#include "tui.h"
#include "util.h"

#include <archive.h>
#include <archive_entry.h>

#include <sys/stat.h>

#include <cerrno>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace bpack {
namespace {

struct zip_writer : unmovable {
  zip_writer() : handle(archive_write_new()) {
    if (!handle) { throw std::runtime_error("archive_write_new failed"); }
    if (archive_write_set_format_zip(handle) != ARCHIVE_OK) {
      throw std::runtime_error(std::string("archive_write_set_format_zip failed: ") +
                               archive_error_string(handle));
    }
    if (archive_write_zip_set_compression_deflate(handle) != ARCHIVE_OK) {
      throw std::runtime_error(
          std::string("archive_write_zip_set_compression_deflate failed: ") +
          archive_error_string(handle));
    }
  }

  ~zip_writer() {
    if (handle) { archive_write_free(handle); }
  }

  std::string error() const {
    char const *msg{ archive_error_string(handle) };
    return msg ? msg : "unknown libarchive error";
  }

  archive *handle{ nullptr };
};

void write_entry(zip_writer &writer, file_entry const &file, std::vector<char> &buffer) {
  struct stat st{};
  if (::stat(file.path.c_str(), &st) != 0) {
    throw std::system_error(errno,
                            std::generic_category(),
                            "zip_archive: failed to stat " + file.path.string());
  }
  if (!S_ISREG(st.st_mode)) {
    throw std::runtime_error("zip_archive: not a regular file: " + file.path.string());
  }

  file_ptr_t const in{ util_open_file(file.path, "rb") };
  if (!in) {
    throw std::system_error(errno,
                            std::generic_category(),
                            "zip_archive: failed to open " + file.path.string());
  }

  std::unique_ptr<archive_entry, decltype(&archive_entry_free)> entry{ archive_entry_new(),
                                                                       &archive_entry_free };
  if (!entry) { throw std::runtime_error("archive_entry_new failed"); }

  archive_entry_set_pathname(entry.get(), file.name.c_str());
  archive_entry_set_filetype(entry.get(), AE_IFREG);
  archive_entry_set_perm(entry.get(), st.st_mode & 07777);
  archive_entry_set_size(entry.get(), st.st_size);
  archive_entry_set_mtime(entry.get(), st.st_mtim.tv_sec, st.st_mtim.tv_nsec);

  if (archive_write_header(writer.handle, entry.get()) != ARCHIVE_OK) {
    throw std::runtime_error("zip_archive: failed to write header for " + file.name + ": " +
                             writer.error());
  }

  while (true) {
    auto const n{ std::fread(buffer.data(), 1, buffer.size(), in.get()) };
    if (n > 0 && archive_write_data(writer.handle, buffer.data(), n) < 0) {
      throw std::runtime_error("zip_archive: failed to write data for " + file.name + ": " +
                               writer.error());
    }
    if (n < buffer.size()) {
      if (std::ferror(in.get())) {
        throw std::runtime_error("zip_archive: failed to read " + file.path.string());
      }
      break;
    }
  }

  if (archive_write_finish_entry(writer.handle) != ARCHIVE_OK) {
    throw std::runtime_error("zip_archive: failed to finish entry " + file.name + ": " +
                             writer.error());
  }
}

}  // namespace

void zip_archive_build(std::filesystem::path const &archive_path,
                       std::vector<file_entry> const &files) {
  auto const dest{ std::filesystem::absolute(archive_path).lexically_normal() };
  scoped_path_cleanup temp{ platform::make_temp_file(dest.parent_path(),
                                                     dest.filename().string() + ".tmp-") };

  {
    zip_writer writer;
    if (archive_write_open_filename(writer.handle, temp.path().c_str()) != ARCHIVE_OK) {
      throw std::runtime_error("zip_archive: failed to open " + temp.path().string() + ": " +
                               writer.error());
    }

    std::vector<char> buffer(64 * 1024);
    for (auto const &file : files) {
      tui::debug("zip_archive: adding %s", file.name.c_str());
      write_entry(writer, file, buffer);
    }

    if (archive_write_close(writer.handle) != ARCHIVE_OK) {
      throw std::runtime_error("zip_archive: failed to finalize " + temp.path().string() +
                               ": " + writer.error());
    }
  }

  // mkstemp creates 0600
  std::filesystem::permissions(temp.path(),
                               std::filesystem::perms::owner_read |
                                   std::filesystem::perms::owner_write |
                                   std::filesystem::perms::group_read |
                                   std::filesystem::perms::others_read,
                               std::filesystem::perm_options::replace);

  platform::atomic_rename(temp.path(), dest);
  temp.release();

  tui::debug("zip_archive: wrote %zu entries to %s", files.size(), dest.string().c_str());
}

}  // namespace bpack
