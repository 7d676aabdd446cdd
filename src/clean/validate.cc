#include "velo/clean/validate.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <utility>

#include "fmt/core.h"

#include "velo/logging.h"

namespace velo::clean {

namespace {

constexpr auto const kMemberCasual =
    std::array<std::string_view, 2U>{"member", "casual"};

struct validator {
  template <typename T>
  bool not_null(std::size_t const row,
                std::string_view const column,
                std::optional<T> const& value) {
    if (!value.has_value()) {
      report_.failures_.push_back({row, column, check::kNotNull, "null"});
      return false;
    }
    return true;
  }

  void coordinate(std::size_t const row,
                  std::string_view const column,
                  std::optional<double> const& value) {
    if (not_null(row, column, value) && !std::isfinite(*value)) {
      report_.failures_.push_back(
          {row, column, check::kFinite, fmt::format("{}", *value)});
    }
  }

  validation_report report_;
};

}  // namespace

validation_report validate(std::string_view city, trips const& in) {
  auto v = validator{};
  auto ride_ids = hash_set<std::string_view>{};
  for (auto row = std::size_t{0U}; row != in.size(); ++row) {
    auto const& t = in[row];

    if (v.not_null(row, "ride_id", t.ride_id_) &&
        !ride_ids.emplace(*t.ride_id_).second) {
      v.report_.failures_.push_back(
          {row, "ride_id", check::kUnique, *t.ride_id_});
    }

    v.not_null(row, "rideable_type", t.rideable_type_);
    v.not_null(row, "started_at", t.started_at_);
    v.not_null(row, "ended_at", t.ended_at_);
    v.coordinate(row, "start_lat", t.start_lat_);
    v.coordinate(row, "end_lat", t.end_lat_);
    v.coordinate(row, "start_lng", t.start_lng_);
    v.coordinate(row, "end_lng", t.end_lng_);

    if (v.not_null(row, "member_casual", t.member_casual_) &&
        std::find(begin(kMemberCasual), end(kMemberCasual),
                  std::string_view{*t.member_casual_}) == end(kMemberCasual)) {
      v.report_.failures_.push_back(
          {row, "member_casual", check::kIsIn, *t.member_casual_});
    }
  }

  if (v.report_.ok()) {
    log(log_lvl::info, "clean.validate",
        "Cleaned data validated successfully for {}.", city);
  } else {
    log(log_lvl::error, "clean.validate",
        "Data validation failed for {}: {} failure cases", city,
        v.report_.failures_.size());
    for (auto const& f : v.report_.failures_) {
      log(log_lvl::debug, "clean.validate",
          "{}: row={} column={} check={} value={}", city, f.row_, f.column_,
          to_str(f.check_), f.value_);
    }
  }

  return std::move(v.report_);
}

}  // namespace velo::clean
