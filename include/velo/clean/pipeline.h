#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

#include "velo/clean/filters.h"
#include "velo/clean/validate.h"
#include "velo/types.h"

namespace velo::clean {

struct clean_config {
  double min_duration_minutes_{kDefaultMinDurationMinutes};
  double max_duration_minutes_{kDefaultMaxDurationMinutes};
  bool strict_validation_{false};
};

struct stage_stats {
  std::size_t removed() const { return before_ - after_; }

  std::string_view stage_;
  std::size_t before_;
  std::size_t after_;
};

struct clean_result {
  std::size_t removed() const;

  trips trips_;
  std::vector<stage_stats> stages_;
  validation_report validation_;
};

// Runs deduplicate, missing-value, geofence, duration and distance filters
// in this order, then validates the result.
// Filter failures are rethrown as stage_error. Validation failures only
// throw (stage "validate") with strict_validation_ set.
clean_result clean_trips(std::string_view city,
                         trips const&,
                         stations const&,
                         clean_config const& = {});

}  // namespace velo::clean
