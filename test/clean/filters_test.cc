#include "gtest/gtest.h"

#include <cmath>
#include <functional>
#include <numbers>
#include <set>
#include <string>

#include "velo/clean/filters.h"
#include "velo/errors.h"
#include "velo/haversine.h"

#include "../trip_util.h"

using namespace velo;
using namespace velo::clean;
using velo::test::make_trip;
using namespace std::chrono_literals;

namespace {

constexpr auto const kCity = "Testville";

stations square_0_10() { return {{0.0, 0.0}, {10.0, 10.0}, {3.0, 7.0}}; }

std::vector<std::string> ids(trips const& t) {
  auto ret = std::vector<std::string>{};
  for (auto const& x : t) {
    ret.emplace_back(x.ride_id_.value_or("<null>"));
  }
  return ret;
}

}  // namespace

TEST(clean, duplicates_keep_first_occurrence) {
  auto in = trips{make_trip("A", 1, 1, 2, 2), make_trip("B", 1, 1, 2, 2),
                  make_trip("A", 3, 3, 4, 4), make_trip("C", 1, 1, 2, 2),
                  make_trip("B", 5, 5, 6, 6)};
  in[2].rideable_type_ = "electric_bike";

  auto const out = filter_duplicates(kCity, in);
  EXPECT_EQ((std::vector<std::string>{"A", "B", "C"}), ids(out));
  EXPECT_EQ("classic_bike", out[0].rideable_type_);
  EXPECT_EQ(1.0, out[0].start_lat_);
  EXPECT_EQ(5U, in.size());
}

TEST(clean, duplicates_idempotent_and_unique) {
  auto const in =
      trips{make_trip("A", 1, 1, 2, 2), make_trip("A", 1, 1, 2, 2),
            make_trip("B", 1, 1, 2, 2), make_trip("A", 1, 1, 2, 2)};
  auto const once = filter_duplicates(kCity, in);
  auto const twice = filter_duplicates(kCity, once);
  EXPECT_EQ(ids(once), ids(twice));

  auto const once_ids = ids(once);
  auto const unique = std::set<std::string>{begin(once_ids), end(once_ids)};
  EXPECT_EQ(once.size(), unique.size());
}

TEST(clean, duplicates_absent_ride_id_collapses) {
  auto in = trips{make_trip("", 1, 1, 2, 2), make_trip("", 1, 1, 2, 2),
                  make_trip("X", 1, 1, 2, 2)};
  in[0].ride_id_ = std::nullopt;
  in[1].ride_id_ = std::nullopt;
  EXPECT_EQ((std::vector<std::string>{"<null>", "X"}),
            ids(filter_duplicates(kCity, in)));
}

TEST(clean, missing_values_critical_columns) {
  auto in = trips{};
  for (auto i = 0; i != 8; ++i) {
    in.emplace_back(make_trip(std::to_string(i), 1, 1, 2, 2));
  }
  in[1].ride_id_ = std::nullopt;
  in[2].started_at_ = std::nullopt;
  in[3].ended_at_ = std::nullopt;
  in[4].start_lat_ = std::nullopt;
  in[5].start_lng_ = std::nullopt;
  in[6].end_lat_ = std::nullopt;
  in[7].end_lng_ = std::nullopt;

  EXPECT_EQ((std::vector<std::string>{"0"}),
            ids(filter_missing_values(kCity, in)));
}

TEST(clean, missing_values_ignore_nullable_columns) {
  auto in = trips{make_trip("A", 1, 1, 2, 2)};
  in[0].rideable_type_ = std::nullopt;
  in[0].member_casual_ = std::nullopt;
  in[0].start_station_id_ = std::nullopt;
  EXPECT_EQ(1U, filter_missing_values(kCity, in).size());
}

TEST(clean, station_bounds) {
  auto const box = station_bounds(kCity, square_0_10());
  EXPECT_EQ(0.0, box.min_.lat_);
  EXPECT_EQ(0.0, box.min_.lng_);
  EXPECT_EQ(10.0, box.max_.lat_);
  EXPECT_EQ(10.0, box.max_.lng_);
}

TEST(clean, geofence_end_point_inclusive) {
  auto const in = trips{make_trip("inside", 20, 20, 5, 5),
                        make_trip("north", 5, 5, 11, 5),
                        make_trip("corner", 5, 5, 10, 10),
                        make_trip("west", 5, 5, 5, -0.5),
                        make_trip("origin", 5, 5, 0, 0)};
  EXPECT_EQ((std::vector<std::string>{"inside", "corner", "origin"}),
            ids(filter_by_geofence(kCity, in, square_0_10())));
}

TEST(clean, geofence_without_stations) {
  auto const in = trips{make_trip("A", 1, 1, 2, 2)};
  EXPECT_THROW(filter_by_geofence(kCity, in, stations{}),
               no_reference_geometry);
}

TEST(clean, duration_window_inclusive) {
  auto const in = trips{make_trip("exact", 1, 1, 2, 2, 60min),
                        make_trip("over", 1, 1, 2, 2, 60min + 6ms),
                        make_trip("negative", 1, 1, 2, 2, -1min),
                        make_trip("zero", 1, 1, 2, 2, 0min),
                        make_trip("short", 1, 1, 2, 2, 30s)};
  EXPECT_EQ((std::vector<std::string>{"exact", "zero", "short"}),
            ids(filter_by_duration(kCity, in, 0.0, 60.0)));
}

TEST(clean, duration_default_window_is_one_day) {
  auto const in = trips{make_trip("day", 1, 1, 2, 2, 24h),
                        make_trip("day_and_a_second", 1, 1, 2, 2, 24h + 1s)};
  EXPECT_EQ((std::vector<std::string>{"day"}),
            ids(filter_by_duration(kCity, in)));
}

TEST(clean, trip_durations) {
  auto in = trips{make_trip("A", 1, 1, 2, 2, 90s), make_trip("B", 1, 1, 2, 2)};
  in[1].ended_at_ = std::nullopt;
  auto const d = trip_durations_minutes(in);
  EXPECT_DOUBLE_EQ(1.5, d[0]);
  EXPECT_TRUE(std::isnan(d[1]));
}

TEST(clean, distance_zero_excluded) {
  // 0.001 km north of the start point.
  auto const lat_1m =
      41.0 + 0.001 / (kEarthRadiusKm * std::numbers::pi / 180.0);
  auto const in = trips{make_trip("round_trip", 41.0, -87.0, 41.0, -87.0),
                        make_trip("one_meter", 41.0, -87.0, lat_1m, -87.0)};

  auto const d = trip_distances_km(in);
  EXPECT_EQ(0.0, d[0]);
  EXPECT_NEAR(0.001, d[1], 1e-9);

  EXPECT_EQ((std::vector<std::string>{"one_meter"}),
            ids(filter_by_distance(kCity, in)));
}

TEST(clean, every_stage_shrinks_monotonically) {
  auto in = trips{make_trip("A", 1, 1, 2, 2), make_trip("A", 1, 1, 2, 2),
                  make_trip("B", 1, 1, 1, 1), make_trip("C", 1, 1, 12, 2),
                  make_trip("D", 1, 1, 2, 2, 2000min)};
  in.emplace_back(make_trip("E", 1, 1, 2, 2)).end_lat_ = std::nullopt;

  auto const stages = std::vector<std::function<trips(trips const&)>>{
      [](trips const& t) { return filter_duplicates(kCity, t); },
      [](trips const& t) { return filter_missing_values(kCity, t); },
      [](trips const& t) {
        return filter_by_geofence(kCity, t, square_0_10());
      },
      [](trips const& t) { return filter_by_duration(kCity, t); },
      [](trips const& t) { return filter_by_distance(kCity, t); }};

  for (auto const& stage : stages) {
    auto const out = stage(in);
    EXPECT_LE(out.size(), in.size());
    EXPECT_LT(out.size(), in.size());
  }
}
