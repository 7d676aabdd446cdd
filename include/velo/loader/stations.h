#pragma once

#include <string>
#include <string_view>

#include "velo/types.h"

namespace velo::loader {

// Maps the coordinate column spellings found in the station exports of the
// different operators (lat/latitude, lng/lon/long/longitude; any case) to
// "lat" and "lng". Other names are returned unchanged.
std::string normalize_station_column(std::string_view);

// Reads lat/lng of every station. Rows with an empty coordinate are skipped.
// Throws coercion_error if a coordinate column is missing or not numeric.
stations read_stations(std::string_view file_content);

}  // namespace velo::loader
