#include "gtest/gtest.h"

#include "velo/loader/dir.h"
#include "velo/loader/files.h"

using namespace velo::loader;
using namespace std::string_view_literals;

TEST(dir, fs_dir) {
  auto const d = fs_dir{"test/test_data/raw"};
  EXPECT_TRUE(d.exists(station_file("Chicago")));
  EXPECT_FALSE(d.exists(station_file("Boston")));

  auto const f = d.get_file(station_file("Chicago"));
  EXPECT_TRUE(f.data().starts_with("station_id,name,Latitude,Longitude\n"));
  EXPECT_THROW(d.get_file(station_file("Boston")), std::exception);
}

TEST(dir, make_dir) {
  auto const d = make_dir("test/test_data/raw");
  EXPECT_TRUE(d->exists(trip_file("Chicago", "202409")));
  EXPECT_THROW(make_dir("test/test_data/raw/Atlantis"), std::exception);
  EXPECT_THROW(make_dir("CMakeLists.txt"), std::exception);
}

TEST(dir, mem_dir_read) {
  constexpr auto const raw = R"(
# Boston/station_data/stations.csv
name,lat,lng
A,42.35,-71.06

# Boston/trip_data/202409/202409-combined.csv
ride_id,started_at,ended_at,start_lat,start_lng,end_lat,end_lng
)"sv;

  auto const d = mem_dir::read(raw);
  EXPECT_TRUE(d.exists(station_file("Boston")));
  EXPECT_TRUE(d.exists(trip_file("Boston", "202409")));
  EXPECT_FALSE(d.exists(trip_file("Boston", "202408")));

  EXPECT_EQ("name,lat,lng\nA,42.35,-71.06\n"sv,
            d.get_file(station_file("Boston")).data());
  EXPECT_EQ("ride_id,started_at,ended_at,start_lat,start_lng,end_lat,end_lng\n"sv,
            d.get_file(trip_file("Boston", "202409")).data());
  EXPECT_THROW(d.get_file(station_file("NYC")), std::exception);
}

TEST(dir, mem_dir_read_relative_names) {
  auto const d = mem_dir::read("# ./NYC/station_data/stations.csv\nlat,lng\n");
  EXPECT_TRUE(d.exists(station_file("NYC")));
  EXPECT_EQ("lat,lng\n"sv, d.get_file(station_file("NYC")).data());
}

TEST(dir, mem_dir_read_empty_file) {
  auto const d = mem_dir::read("# a.csv\n# b.csv\nx");
  ASSERT_TRUE(d.exists("a.csv"));
  EXPECT_TRUE(d.get_file("a.csv").data().empty());
  EXPECT_EQ("x\n"sv, d.get_file("b.csv").data());
}

TEST(dir, mem_dir_add) {
  auto d = mem_dir{};
  d.add({"./NYC/station_data/stations.csv", "lat,lng\n"});
  EXPECT_TRUE(d.exists(station_file("NYC")));
  EXPECT_TRUE(d.exists("NYC//station_data/./stations.csv"));
  EXPECT_EQ("lat,lng\n"sv, d.get_file(station_file("NYC")).data());
}
