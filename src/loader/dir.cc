#include "velo/loader/dir.h"

#include "utl/parser/cstr.h"
#include "utl/verify.h"

#include "fmt/std.h"

#include "velo/logging.h"

namespace velo::loader {

namespace {

std::string key(std::filesystem::path const& p) {
  return p.lexically_normal().generic_string();
}

}  // namespace

std::string_view file::data() const {
  if (auto const* m = std::get_if<cista::mmap>(&content_); m != nullptr) {
    return m->view();
  }
  return std::get<std::string_view>(content_);
}

fs_dir::fs_dir(std::filesystem::path root) : root_{std::move(root)} {}

file fs_dir::get_file(std::filesystem::path const& p) const {
  auto const full_path = root_ / p;
  utl::verify(exists(p), "file {} not found", full_path);

  // Zero sized files cannot be mapped.
  if (std::filesystem::file_size(full_path) == 0U) {
    return file{full_path, std::string_view{}};
  }

  auto f = file{full_path, cista::mmap{full_path.string().c_str(),
                                       cista::mmap::protection::READ}};
  log(log_lvl::info, "loader.fs_dir", "mapped {}: {} bytes", full_path,
      f.data().size());
  return f;
}

bool fs_dir::exists(std::filesystem::path const& p) const {
  return std::filesystem::is_regular_file(root_ / p);
}

mem_dir mem_dir::read(std::string_view s) {
  auto d = mem_dir{};
  auto name = std::string{};
  auto content = std::string{};
  auto in_file = false;

  auto const flush = [&]() {
    if (!in_file) {
      return;
    }
    auto const last = content.find_last_not_of('\n');
    content.resize(last == std::string::npos ? 0U : last + 2U);
    d.add({name, std::move(content)});
    content.clear();
  };

  utl::for_each_line(s, [&](utl::cstr const line) {
    if (line.starts_with("#")) {
      flush();
      name = line.substr(1).trim().to_str();
      in_file = true;
    } else if (in_file) {
      content.append(line.view()).push_back('\n');
    }
  });
  flush();

  return d;
}

mem_dir& mem_dir::add(std::pair<std::filesystem::path, std::string> f) {
  files_.insert_or_assign(key(f.first), std::move(f.second));
  return *this;
}

file mem_dir::get_file(std::filesystem::path const& p) const {
  auto const it = files_.find(key(p));
  utl::verify(it != end(files_), "file {} not found in memory dir", p);
  return file{p, std::string_view{it->second}};
}

bool mem_dir::exists(std::filesystem::path const& p) const {
  return files_.contains(key(p));
}

std::unique_ptr<dir> make_dir(std::filesystem::path const& root) {
  utl::verify(std::filesystem::is_directory(root),
              "raw data root {} is not a directory", root);
  return std::make_unique<fs_dir>(root);
}

}  // namespace velo::loader
