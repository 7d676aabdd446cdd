#include "velo/process.h"

#include <exception>
#include <utility>

#include "fmt/std.h"

#include "velo/errors.h"
#include "velo/loader/files.h"
#include "velo/loader/stations.h"
#include "velo/loader/trips.h"
#include "velo/logging.h"
#include "velo/output/write_trips.h"

namespace velo {

namespace {

template <typename Fn>
auto in_stage(std::string_view city, std::string_view stage, Fn&& fn) {
  try {
    return fn();
  } catch (stage_error const&) {
    throw;
  } catch (std::exception const& e) {
    throw stage_error{std::string{city}, std::string{stage}, e.what()};
  }
}

}  // namespace

city_result process_city(std::string_view city,
                         loader::dir const& raw,
                         batch_config const& c) {
  auto const timer = scoped_timer{fmt::format("clean.{}", city)};
  log(log_lvl::info, "clean.city", "Cleaning data for {}...", city);

  auto const trip_csv = in_stage(city, "read", [&]() {
    return raw.get_file(loader::trip_file(city, c.month_));
  });
  auto const station_csv = in_stage(
      city, "read", [&]() { return raw.get_file(loader::station_file(city)); });

  auto const raw_trips = in_stage(
      city, "coerce", [&]() { return loader::read_trips(trip_csv.data()); });
  auto const station_coords = in_stage(city, "coerce", [&]() {
    return loader::read_stations(station_csv.data());
  });

  auto r = city_result{
      .result_ = clean::clean_trips(city, raw_trips, station_coords, c.clean_),
      .output_ = loader::cleaned_trip_file(c.cleaned_root_, city)};

  in_stage(city, "write",
           [&]() { output::write_trips(r.output_, r.result_.trips_); });

  log(log_lvl::info, "clean.city", "Cleaned data for {} saved to {}", city,
      r.output_);
  return r;
}

batch_result process_all_cities(loader::dir const& raw,
                                batch_config const& c) {
  auto const timer = scoped_timer{"clean.all"};

  std::filesystem::create_directories(c.cleaned_root_);

  auto ret = batch_result{};
  for (auto const& city : c.cities_) {
    try {
      auto const r = process_city(city, raw, c);
      auto const raw_trips = r.result_.trips_.size() + r.result_.removed();
      ret.succeeded_.push_back({city, raw_trips, r.result_.trips_.size(),
                                r.output_});
    } catch (stage_error const& e) {
      log(log_lvl::error, "clean.all", "{}", e.what());
      ret.failed_.push_back({e.city_, e.stage_, e.what()});
    } catch (std::exception const& e) {
      auto msg = fmt::format("{}: {}", city, e.what());
      log(log_lvl::error, "clean.all", "{}", msg);
      ret.failed_.push_back({city, "unknown", std::move(msg)});
    }
  }

  log(log_lvl::info, "clean.all", "{} cities cleaned, {} failed",
      ret.succeeded_.size(), ret.failed_.size());
  return ret;
}

}  // namespace velo
