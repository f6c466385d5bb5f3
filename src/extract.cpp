#include "extract.h"
#include "tui.h"
#include "util.h"

#include "archive.h"
#include "archive_entry.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

namespace anvil {
namespace {

struct archive_reader : unmovable {
  archive_reader() : handle(archive_read_new()) {
    if (!handle) { throw std::runtime_error("archive_read_new failed"); }
    archive_read_support_filter_all(handle);
    archive_read_support_format_all(handle);
  }

  ~archive_reader() {
    if (handle) {
      archive_read_close(handle);
      archive_read_free(handle);
    }
  }

  archive *handle{ nullptr };
};

struct archive_writer : unmovable {
  archive_writer() : handle(archive_write_disk_new()) {
    if (!handle) { throw std::runtime_error("archive_write_disk_new failed"); }
    archive_write_disk_set_options(handle,
                                   ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                                       ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                                       ARCHIVE_EXTRACT_SECURE_SYMLINKS |
                                       ARCHIVE_EXTRACT_SECURE_NOABSOLUTEPATHS);
    archive_write_disk_set_standard_lookup(handle);
  }

  ~archive_writer() {
    if (handle) {
      archive_write_close(handle);
      archive_write_free(handle);
    }
  }

  archive *handle{ nullptr };
};

std::optional<std::string> strip_path_components(char const *path, int strip_count) {
  if (!path) { return std::nullopt; }
  if (strip_count <= 0) { return std::string(path); }

  char const *p{ path };
  int components_stripped{ 0 };

  while (*p == '/') { ++p; }

  while (components_stripped < strip_count) {
    if (*p == '\0') { return std::nullopt; }
    if (*p == '/') {
      ++components_stripped;
      while (*p == '/') { ++p; }
    } else {
      ++p;
    }
  }

  if (*p == '\0') { return std::nullopt; }
  return std::string(p);
}

bool escapes_destination(std::filesystem::path const &relative) {
  if (relative.is_absolute() || relative.has_root_name()) { return true; }
  for (auto const &part : relative) {
    if (part == "..") { return true; }
  }
  return false;
}

}  // namespace

std::uint64_t extract(std::filesystem::path const &archive_path,
                      std::filesystem::path const &destination,
                      extract_options const &options) {
  archive_reader reader;
  archive_writer writer;

  if (archive_read_open_filename(reader.handle, archive_path.string().c_str(), 10240) !=
      ARCHIVE_OK) {
    throw std::runtime_error(std::string("Failed to open archive: ") +
                             archive_error_string(reader.handle));
  }

  std::filesystem::create_directories(destination);

  archive_entry *entry{ nullptr };
  std::uint64_t files_extracted{ 0 };

  while (true) {
    int const r{ archive_read_next_header(reader.handle, &entry) };
    if (r == ARCHIVE_EOF) { break; }
    if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
      throw std::runtime_error(std::string("Failed to read archive header: ") +
                               archive_error_string(reader.handle));
    }

    char const *entry_path{ archive_entry_pathname(entry) };
    if (!entry_path) { throw std::runtime_error("Archive entry has null pathname"); }

    auto const stripped{ strip_path_components(entry_path, options.strip_components) };
    if (!stripped) { continue; }

    std::filesystem::path const relative{ *stripped };
    if (escapes_destination(relative)) {
      throw std::runtime_error("Archive entry escapes destination: " + *stripped);
    }

    bool const is_regular_file{ archive_entry_filetype(entry) == AE_IFREG };
    std::filesystem::path const full_path{ destination / relative };
    if (auto const dir{ full_path.parent_path() }; !dir.empty()) {
      std::filesystem::create_directories(dir);
    }

    {
      std::string const full_path_str{ full_path.string() };
      archive_entry_copy_pathname(entry, full_path_str.c_str());
    }

    if (char const *hardlink{ archive_entry_hardlink(entry) }) {
      auto const link_stripped{ strip_path_components(hardlink, options.strip_components) };
      std::string const hardlink_full{
        (destination / link_stripped.value_or(std::string{ hardlink })).string()
      };
      archive_entry_copy_hardlink(entry, hardlink_full.c_str());
    }

    if (int const write_header_result{ archive_write_header(writer.handle, entry) };
        write_header_result != ARCHIVE_OK && write_header_result != ARCHIVE_WARN) {
      throw std::runtime_error(std::string("Failed to write entry header: ") +
                               archive_error_string(writer.handle));
    }

    if (archive_entry_size(entry) > 0) {
      std::vector<char> buffer(1024 * 1024);

      la_ssize_t bytes_read{ 0 };
      while ((bytes_read =
                  archive_read_data(reader.handle, buffer.data(), buffer.size())) > 0) {
        if (la_ssize_t const bytes_written{
                archive_write_data(writer.handle,
                                   buffer.data(),
                                   static_cast<size_t>(bytes_read)) };
            bytes_written < 0) {
          throw std::runtime_error(std::string("Failed to write entry data: ") +
                                   archive_error_string(writer.handle));
        }
      }

      if (bytes_read < 0) {
        throw std::runtime_error(std::string("Failed to read entry data: ") +
                                 archive_error_string(reader.handle));
      }
    }

    if (archive_write_finish_entry(writer.handle) != ARCHIVE_OK) {
      throw std::runtime_error(std::string("Failed to finish entry: ") +
                               archive_error_string(writer.handle));
    }

    if (is_regular_file) { ++files_extracted; }
  }

  if (files_extracted == 0) {
    throw std::runtime_error("Archive extraction failed: 0 files extracted from " +
                             archive_path.filename().string() +
                             " (archive may be empty, corrupt, or unsupported format)");
  }

  tui::debug("Extracted %llu file(s) from %s",
             static_cast<unsigned long long>(files_extracted),
             archive_path.filename().string().c_str());
  return files_extracted;
}

bool extract_is_archive_extension(std::filesystem::path const &path) {
  static std::unordered_set<std::string> const archive_extensions{
    ".tar", ".tgz", ".tar.gz", ".tar.xz", ".tar.bz2", ".tar.zst", ".zip", ".7z",
  };

  std::string const ext{ path.extension().string() };
  if (archive_extensions.contains(ext)) { return true; }

  return path.stem().has_extension() &&
         archive_extensions.contains(path.stem().extension().string() + ext);
}

std::filesystem::path extract_source_root(std::filesystem::path const &dir) {
  std::optional<std::filesystem::path> only;
  for (auto const &entry : std::filesystem::directory_iterator(dir)) {
    if (only) { return dir; }
    only = entry.path();
  }
  if (only && std::filesystem::is_directory(*only)) { return *only; }
  return dir;
}

}  // namespace anvil
