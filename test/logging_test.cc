#include <iostream>
#include <sstream>

#include "gtest/gtest.h"

#include "velo/logging.h"

using namespace velo;

TEST(logging, parse_log_lvl) {
  EXPECT_EQ(log_lvl::debug, parse_log_lvl("debug"));
  EXPECT_EQ(log_lvl::info, parse_log_lvl("info"));
  EXPECT_EQ(log_lvl::error, parse_log_lvl("error"));
  EXPECT_THROW(parse_log_lvl("verbose"), std::exception);
}

TEST(logging, verbosity_threshold) {
  auto out = std::stringstream{};
  auto const prev_buf = std::clog.rdbuf(out.rdbuf());
  auto const prev_lvl = s_verbosity;

  s_verbosity = log_lvl::info;
  log(log_lvl::debug, "test.logging", "hidden {}", 1);
  log(log_lvl::info, "test.logging", "shown {}", 2);

  s_verbosity = prev_lvl;
  std::clog.rdbuf(prev_buf);

  auto const s = out.str();
  EXPECT_EQ(std::string::npos, s.find("hidden"));
  EXPECT_NE(std::string::npos, s.find("[info][test.logging"));
  EXPECT_NE(std::string::npos, s.find("] shown 2\n"));
  EXPECT_EQ('Z', s.at(s.find(" | ") - 1U));
}
