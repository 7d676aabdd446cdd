#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "utl/parser/cstr.h"

namespace velo::loader {

// Column names of the first line, split outside of quotes, unquoted and
// trimmed.
std::vector<std::string> read_header(std::string_view file_content);

// Throws coercion_error (row 0) naming the first required column that is
// not part of the header.
void verify_columns(std::string_view file_content,
                    std::span<std::string_view const> required);

// Copy of the file content with the first line replaced by the given names.
// Names containing a comma or quote are quoted.
std::string replace_header(std::string_view file_content,
                           std::vector<std::string> const& columns);

// Empty (after trimming) yields nullopt, anything that is not entirely a
// floating point number throws coercion_error.
std::optional<double> parse_number(std::size_t row,
                                   char const* column,
                                   utl::cstr);

}  // namespace velo::loader
