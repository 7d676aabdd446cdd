#pragma once

#include <filesystem>
#include <string_view>

namespace velo::loader {

constexpr auto const kTripDataDir = std::string_view{"trip_data"};
constexpr auto const kStationDataDir = std::string_view{"station_data"};
constexpr auto const kStationsFile = std::string_view{"stations.csv"};
constexpr auto const kCleanedTripsSuffix =
    std::string_view{"_cleaned_trips.csv"};

// <City>/trip_data/<month>/<month>-combined.csv
std::filesystem::path trip_file(std::string_view city, std::string_view month);

// <City>/station_data/stations.csv
std::filesystem::path station_file(std::string_view city);

// <cleaned_root>/<City>/<City>_cleaned_trips.csv
std::filesystem::path cleaned_trip_file(
    std::filesystem::path const& cleaned_root, std::string_view city);

}  // namespace velo::loader
