#include "velo/clean/pipeline.h"

#include <exception>
#include <string>
#include <utility>

#include "fmt/core.h"

#include "utl/verify.h"

#include "velo/errors.h"
#include "velo/logging.h"

namespace velo::clean {

std::size_t clean_result::removed() const {
  auto n = std::size_t{0U};
  for (auto const& s : stages_) {
    n += s.removed();
  }
  return n;
}

clean_result clean_trips(std::string_view city,
                         trips const& raw,
                         stations const& station_coords,
                         clean_config const& c) {
  utl::verify(c.min_duration_minutes_ <= c.max_duration_minutes_,
              "invalid duration window [{}, {}]", c.min_duration_minutes_,
              c.max_duration_minutes_);

  auto r = clean_result{};
  auto current = raw;

  auto const run = [&](std::string_view stage, auto&& filter) {
    log(log_lvl::info, "clean.pipeline", "{}: stage {}", city, stage);
    auto next = trips{};
    try {
      next = filter(current);
    } catch (std::exception const& e) {
      throw stage_error{std::string{city}, std::string{stage}, e.what()};
    }
    r.stages_.push_back({stage, current.size(), next.size()});
    current = std::move(next);
  };

  run("deduplicate",
      [&](trips const& t) { return filter_duplicates(city, t); });
  run("missing_values",
      [&](trips const& t) { return filter_missing_values(city, t); });
  run("geofence", [&](trips const& t) {
    return filter_by_geofence(city, t, station_coords);
  });
  run("duration", [&](trips const& t) {
    return filter_by_duration(city, t, c.min_duration_minutes_,
                              c.max_duration_minutes_);
  });
  run("distance", [&](trips const& t) { return filter_by_distance(city, t); });

  r.validation_ = validate(city, current);
  if (!r.validation_.ok() && c.strict_validation_) {
    throw stage_error{std::string{city}, "validate",
                      fmt::format("{} schema failure cases",
                                  r.validation_.failures_.size())};
  }

  r.trips_ = std::move(current);
  log(log_lvl::info, "clean.pipeline", "{}: kept {} of {} trips", city,
      r.trips_.size(), raw.size());
  return r;
}

}  // namespace velo::clean
