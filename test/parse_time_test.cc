#include "gtest/gtest.h"

#include "date/date.h"

#include "velo/parse_time.h"

using namespace velo;
using namespace date;
using namespace std::chrono_literals;

TEST(parse_time, space_separated) {
  EXPECT_EQ(timestamp_t{sys_days{2024_y / September / 1} + 7h + 7min},
            parse_timestamp("2024-09-01 07:07:00"));
}

TEST(parse_time, iso_separated) {
  EXPECT_EQ(timestamp_t{sys_days{2024_y / September / 1} + 7h + 7min},
            parse_timestamp("2024-09-01T07:07:00"));
}

TEST(parse_time, fractional_seconds) {
  EXPECT_EQ(
      timestamp_t{sys_days{2024_y / September / 30} + 23h + 59min + 59s +
                  123456us},
      parse_timestamp("2024-09-30 23:59:59.123456"));
  EXPECT_EQ(timestamp_t{sys_days{2024_y / September / 1} + 500ms},
            parse_timestamp("2024-09-01 00:00:00.5"));
}

TEST(parse_time, invalid) {
  EXPECT_THROW(parse_timestamp("invalid"), std::exception);
  EXPECT_THROW(parse_timestamp("2024-09-01"), std::exception);
  EXPECT_THROW(parse_timestamp("2024-09-01 07:07:00 UTC"), std::exception);
  EXPECT_THROW(parse_timestamp(""), std::exception);
}

TEST(parse_time, format) {
  EXPECT_EQ("2024-09-01 07:07:00.250000",
            format_timestamp(timestamp_t{sys_days{2024_y / September / 1} +
                                         7h + 7min + 250ms}));
}
