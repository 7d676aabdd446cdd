#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace velo {

// Raw value that cannot be converted to its column type. Rows are 1-based
// data rows (the header is row 0).
struct coercion_error : public std::runtime_error {
  coercion_error(std::size_t row, std::string column, std::string const& msg);

  std::size_t row_;
  std::string column_;
};

// The geofence needs at least one station coordinate.
struct no_reference_geometry : public std::runtime_error {
  explicit no_reference_geometry(std::string_view city);
};

// Fatal failure of one city's run, tagged with the step that failed.
struct stage_error : public std::runtime_error {
  stage_error(std::string city, std::string stage, std::string_view cause);

  std::string city_;
  std::string stage_;
};

}  // namespace velo
