// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_UPLOADER_IMPL_HPP
#define CIRRUS_UPLOADER_IMPL_HPP

#include <filesystem>
#include <system_error>

#include "uploader_interfaces.hpp"

namespace cirrus {
namespace uploader {

/**
 * Default implementation of IFileSystem using std::filesystem
 */
class FileSystemImpl : public IFileSystem {
public:
  bool exists(const std::string& path) const override {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
  }

  bool is_regular_file(const std::string& path) const override {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
  }

  uint64_t file_size(const std::string& path) const override {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    return ec ? 0 : static_cast<uint64_t>(size);
  }

  uint64_t directory_size(const std::string& path) const override {
    std::error_code ec;
    uint64_t total = 0;
    std::filesystem::recursive_directory_iterator it(path, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
      std::error_code entry_ec;
      if (it->is_regular_file(entry_ec)) {
        auto size = it->file_size(entry_ec);
        if (!entry_ec) {
          total += static_cast<uint64_t>(size);
        }
      }
    }
    return total;
  }

  bool remove(const std::string& path) const override {
    std::error_code ec;
    return std::filesystem::remove(path, ec);
  }

  bool rename(const std::string& old_path, const std::string& new_path) const override {
    std::error_code ec;
    std::filesystem::rename(old_path, new_path, ec);
    return !ec;
  }

  bool copy_file(const std::string& from, const std::string& to) const override {
    std::error_code ec;
    std::filesystem::copy_file(
      from, to, std::filesystem::copy_options::overwrite_existing, ec
    );
    return !ec;
  }

  bool create_directories(const std::string& path) const override {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    return !ec && std::filesystem::is_directory(path, ec);
  }
};

}  // namespace uploader
}  // namespace cirrus

#endif  // CIRRUS_UPLOADER_IMPL_HPP
