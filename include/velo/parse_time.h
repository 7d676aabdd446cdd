#pragma once

#include <string>
#include <string_view>

#include "velo/types.h"

namespace velo {

// Accepts "YYYY-MM-DD HH:MM:SS[.ffffff]" and the ISO "T" separated form.
// Throws if the whole string is not a timestamp.
timestamp_t parse_timestamp(std::string_view);

// "YYYY-MM-DD HH:MM:SS.ffffff"
std::string format_timestamp(timestamp_t);

}  // namespace velo
