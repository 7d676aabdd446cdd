#include "velo/errors.h"

#include <utility>

#include "fmt/core.h"

namespace velo {

coercion_error::coercion_error(std::size_t const row,
                               std::string column,
                               std::string const& msg)
    : std::runtime_error{fmt::format("row {}, column {}: {}", row, column,
                                     msg)},
      row_{row},
      column_{std::move(column)} {}

no_reference_geometry::no_reference_geometry(std::string_view city)
    : std::runtime_error{fmt::format(
          "{}: no station coordinates, geofence is undefined", city)} {}

stage_error::stage_error(std::string city,
                         std::string stage,
                         std::string_view cause)
    : std::runtime_error{fmt::format("{}: {} failed: {}", city, stage, cause)},
      city_{std::move(city)},
      stage_{std::move(stage)} {}

}  // namespace velo
