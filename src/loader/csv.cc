#include "velo/loader/csv.h"

#include <algorithm>
#include <charconv>
#include <utility>

#include "boost/algorithm/string.hpp"
#include "boost/tokenizer.hpp"

#include "fmt/core.h"

#include "velo/errors.h"

namespace velo::loader {

namespace {

constexpr auto const kTrimChars = " \t\r\"\xEF\xBB\xBF";  // incl. UTF-8 BOM

std::string_view first_line(std::string_view file_content) {
  return file_content.substr(0U, file_content.find('\n'));
}

}  // namespace

std::vector<std::string> read_header(std::string_view file_content) {
  auto const line = first_line(file_content);
  if (line.empty()) {
    return {};
  }

  using separator = boost::escaped_list_separator<char>;
  auto const header = std::string{line};
  auto columns = std::vector<std::string>{};
  for (auto c : boost::tokenizer<separator>{
           header, separator{std::string{}, ",", "\""}}) {
    boost::algorithm::trim_if(c, boost::algorithm::is_any_of(kTrimChars));
    columns.emplace_back(std::move(c));
  }
  return columns;
}

void verify_columns(std::string_view file_content,
                    std::span<std::string_view const> required) {
  auto const columns = read_header(file_content);
  for (auto const& r : required) {
    if (std::find(begin(columns), end(columns), r) == end(columns)) {
      throw coercion_error{0U, std::string{r}, "column missing in header"};
    }
  }
}

std::string replace_header(std::string_view file_content,
                           std::vector<std::string> const& columns) {
  auto const line = first_line(file_content);
  auto s = std::string{};
  auto first = true;
  for (auto const& c : columns) {
    if (!std::exchange(first, false)) {
      s.push_back(',');
    }
    if (c.find_first_of(",\"") == std::string::npos) {
      s.append(c);
    } else {
      s.append(fmt::format("\"{}\"", boost::algorithm::replace_all_copy(
                                          c, "\"", "\"\"")));
    }
  }
  s.append(file_content.substr(line.size()));
  return s;
}

std::optional<double> parse_number(std::size_t const row,
                                   char const* column,
                                   utl::cstr const s) {
  auto const t = s.trim();
  if (t.empty()) {
    return std::nullopt;
  }
  auto x = 0.0;
  auto const [ptr, ec] = std::from_chars(t.begin(), t.end(), x);
  if (ec != std::errc{} || ptr != t.end()) {
    throw coercion_error{row, column,
                         fmt::format("invalid number \"{}\"", t.view())};
  }
  return x;
}

}  // namespace velo::loader
