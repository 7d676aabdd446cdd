#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "velo/types.h"

namespace velo::clean {

enum class check : std::uint8_t { kNotNull, kUnique, kIsIn, kFinite };

constexpr char const* to_str(check const c) {
  switch (c) {
    case check::kNotNull: return "not_nullable";
    case check::kUnique: return "field_uniqueness";
    case check::kIsIn: return "isin";
    case check::kFinite: return "finite";
  }
  return "";
}

struct failure_case {
  std::size_t row_;
  std::string_view column_;
  check check_;
  std::string value_;
};

struct validation_report {
  bool ok() const { return failures_.empty(); }

  std::vector<failure_case> failures_;
};

// Certifies the cleaned trip schema: ride_id unique and present,
// rideable_type and member_casual present with member_casual in
// {member, casual}, both timestamps present, all four coordinates present
// and finite. Station names and ids are nullable and not checked.
validation_report validate(std::string_view city, trips const&);

}  // namespace velo::clean
