#pragma once

#include <string_view>
#include <vector>

#include "geo/box.h"

#include "velo/types.h"

namespace velo::clean {

constexpr auto const kDefaultMinDurationMinutes = 0.0;
constexpr auto const kDefaultMaxDurationMinutes = 24.0 * 60.0;

// Each filter returns a new collection holding the kept trips in input
// order and logs the number of removed trips tagged with the city.

// Keeps the first trip per ride_id.
trips filter_duplicates(std::string_view city, trips const&);

// Drops trips lacking ride_id, started_at, ended_at or any coordinate.
trips filter_missing_values(std::string_view city, trips const&);

// Bounding box over all station coordinates.
// Throws no_reference_geometry for an empty collection.
geo::box station_bounds(std::string_view city, stations const&);

// Keeps trips whose end coordinate lies inside the closed station box.
trips filter_by_geofence(std::string_view city,
                         trips const&,
                         stations const&);

// Keeps trips with min_minutes <= duration <= max_minutes.
trips filter_by_duration(std::string_view city,
                         trips const&,
                         double min_minutes = kDefaultMinDurationMinutes,
                         double max_minutes = kDefaultMaxDurationMinutes);

// Keeps trips whose start and end are a strictly positive distance apart.
trips filter_by_distance(std::string_view city, trips const&);

// ended_at - started_at in minutes, NaN where a timestamp is absent.
std::vector<double> trip_durations_minutes(trips const&);

// Start to end distance in km, NaN where a coordinate is absent.
std::vector<double> trip_distances_km(trips const&);

}  // namespace velo::clean
