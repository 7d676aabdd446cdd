#pragma once

#include <span>
#include <vector>

#include "geo/latlng.h"

namespace velo {

constexpr auto const kEarthRadiusKm = 6371.0;

// Great-circle distance in kilometers. NaN coordinates yield NaN.
double haversine_km(geo::latlng const& a, geo::latlng const& b);

// Element-wise over four equally sized columns.
std::vector<double> haversine_km(std::span<double const> lat1,
                                 std::span<double const> lng1,
                                 std::span<double const> lat2,
                                 std::span<double const> lng2);

}  // namespace velo
