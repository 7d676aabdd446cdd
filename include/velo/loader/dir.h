#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "cista/mmap.h"

namespace velo::loader {

// Content of one raw input. Mapped files own their mapping, in-memory
// files refer to the buffer of the mem_dir they were taken from.
struct file {
  std::string_view data() const;

  std::filesystem::path path_;
  std::variant<std::string_view, cista::mmap> content_;
};

// Read-only view of the raw data root (one sub directory per city).
struct dir {
  virtual ~dir() = default;

  // Throws if the file does not exist.
  virtual file get_file(std::filesystem::path const&) const = 0;
  virtual bool exists(std::filesystem::path const&) const = 0;
};

struct fs_dir final : public dir {
  explicit fs_dir(std::filesystem::path root);

  file get_file(std::filesystem::path const&) const final;
  bool exists(std::filesystem::path const&) const final;

  std::filesystem::path root_;
};

struct mem_dir final : public dir {
  // "# <path>" lines start a new file, the following lines up to the next
  // "# <path>" line are its content. Trailing empty lines are dropped.
  static mem_dir read(std::string_view);

  mem_dir& add(std::pair<std::filesystem::path, std::string>);

  file get_file(std::filesystem::path const&) const final;
  bool exists(std::filesystem::path const&) const final;

  std::map<std::string, std::string> files_;
};

// Throws if `root` is not a directory.
std::unique_ptr<dir> make_dir(std::filesystem::path const& root);

}  // namespace velo::loader
