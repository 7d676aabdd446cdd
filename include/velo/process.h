#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "velo/clean/pipeline.h"
#include "velo/loader/dir.h"

namespace velo {

struct batch_config {
  std::filesystem::path raw_root_{"raw_data"};
  std::filesystem::path cleaned_root_{"cleaned_data"};
  std::vector<std::string> cities_{"NYC", "Chicago", "Boston", "Capital"};
  std::string month_{"202409"};
  clean::clean_config clean_{};
};

struct city_result {
  clean::clean_result result_;
  std::filesystem::path output_;
};

// Reads <City>/trip_data/<month>/<month>-combined.csv and
// <City>/station_data/stations.csv from the raw dir, cleans the trips and
// writes <cleaned_root>/<City>/<City>_cleaned_trips.csv.
// Every fatal failure is reported as stage_error.
city_result process_city(std::string_view city,
                         loader::dir const& raw,
                         batch_config const&);

struct batch_result {
  struct success {
    std::string city_;
    std::size_t raw_trips_;
    std::size_t cleaned_trips_;
    std::filesystem::path output_;
  };

  struct failure {
    std::string city_;
    std::string stage_;
    std::string message_;
  };

  bool ok() const { return failed_.empty(); }

  std::vector<success> succeeded_;
  std::vector<failure> failed_;
};

// Runs process_city for every configured city. A failing city is logged and
// recorded, the remaining cities are still processed.
batch_result process_all_cities(loader::dir const& raw, batch_config const&);

}  // namespace velo
