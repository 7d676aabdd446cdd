#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "date/date.h"

#include "ankerl/cista_adapter.h"

#include "cista/hash.h"

namespace velo {

template <typename K,
          typename Hash = cista::hash_all,
          typename Equality = cista::equals_all>
using hash_set = cista::raw::ankerl_set<K, Hash, Equality>;

// Durations are compared against minute bounds with sub-second resolution.
using timestamp_t = date::sys_time<std::chrono::microseconds>;

using minutes_f = std::chrono::duration<double, std::ratio<60>>;

// One bike-share ride. Every field is optional at the ingestion boundary;
// absent values are explicit, coordinates are never encoded as 0.0.
struct trip {
  std::optional<std::string> ride_id_;
  std::optional<std::string> rideable_type_;
  std::optional<timestamp_t> started_at_;
  std::optional<timestamp_t> ended_at_;
  std::optional<std::string> start_station_name_;
  std::optional<std::string> start_station_id_;
  std::optional<std::string> end_station_name_;
  std::optional<std::string> end_station_id_;
  std::optional<double> start_lat_;
  std::optional<double> start_lng_;
  std::optional<double> end_lat_;
  std::optional<double> end_lng_;
  std::optional<std::string> member_casual_;
};

using trips = std::vector<trip>;

struct station {
  double lat_;
  double lng_;
};

using stations = std::vector<station>;

}  // namespace velo
