#include "velo/loader/files.h"

#include "fmt/core.h"

namespace velo::loader {

std::filesystem::path trip_file(std::string_view city,
                                std::string_view month) {
  return std::filesystem::path{city} / kTripDataDir / month /
         fmt::format("{}-combined.csv", month);
}

std::filesystem::path station_file(std::string_view city) {
  return std::filesystem::path{city} / kStationDataDir / kStationsFile;
}

std::filesystem::path cleaned_trip_file(
    std::filesystem::path const& cleaned_root, std::string_view city) {
  return cleaned_root / city / fmt::format("{}{}", city, kCleanedTripsSuffix);
}

}  // namespace velo::loader
