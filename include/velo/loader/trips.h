#pragma once

#include <array>
#include <string_view>

#include "velo/types.h"

namespace velo::loader {

constexpr auto const kRequiredTripColumns = std::array<std::string_view, 7U>{
    "ride_id", "started_at", "ended_at", "start_lat",
    "start_lng", "end_lat",  "end_lng"};

// Parses a raw trip CSV and coerces every column to its type.
// Empty fields and 0.0 coordinates become absent values.
// Throws coercion_error for missing required columns and for values that
// are not timestamps / numbers.
trips read_trips(std::string_view file_content);

}  // namespace velo::loader
