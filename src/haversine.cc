#include "velo/haversine.h"

#include <cmath>
#include <numbers>

#include "utl/verify.h"

namespace velo {

namespace {

constexpr double to_rad(double const deg) {
  return deg * std::numbers::pi / 180.0;
}

double haversine(double const lat1,
                 double const lng1,
                 double const lat2,
                 double const lng2) {
  auto const phi1 = to_rad(lat1);
  auto const phi2 = to_rad(lat2);
  auto const d_phi = to_rad(lat2 - lat1);
  auto const d_lambda = to_rad(lng2 - lng1);

  auto const sin_phi = std::sin(d_phi / 2.0);
  auto const sin_lambda = std::sin(d_lambda / 2.0);
  auto const a = sin_phi * sin_phi +
                 std::cos(phi1) * std::cos(phi2) * sin_lambda * sin_lambda;
  auto const c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));

  return kEarthRadiusKm * c;
}

}  // namespace

double haversine_km(geo::latlng const& a, geo::latlng const& b) {
  return haversine(a.lat_, a.lng_, b.lat_, b.lng_);
}

std::vector<double> haversine_km(std::span<double const> lat1,
                                 std::span<double const> lng1,
                                 std::span<double const> lat2,
                                 std::span<double const> lng2) {
  utl::verify(lat1.size() == lng1.size() && lat1.size() == lat2.size() &&
                  lat1.size() == lng2.size(),
              "haversine_km: column sizes differ ({}, {}, {}, {})",
              lat1.size(), lng1.size(), lat2.size(), lng2.size());

  auto distances = std::vector<double>(lat1.size());
  for (auto i = std::size_t{0U}; i != lat1.size(); ++i) {
    distances[i] = haversine(lat1[i], lng1[i], lat2[i], lng2[i]);
  }
  return distances;
}

}  // namespace velo
