#pragma once

#include <array>
#include <filesystem>
#include <iosfwd>
#include <string_view>

#include "velo/types.h"

namespace velo::output {

constexpr auto const kTripColumns = std::array<std::string_view, 13U>{
    "ride_id",          "rideable_type",    "started_at",
    "ended_at",         "start_station_name", "start_station_id",
    "end_station_name", "end_station_id",   "start_lat",
    "start_lng",        "end_lat",          "end_lng",
    "member_casual"};

void write_trips(std::ostream&, trips const&);

// Creates missing parent directories.
void write_trips(std::filesystem::path const&, trips const&);

}  // namespace velo::output
