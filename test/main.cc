#include <filesystem>

#include "gtest/gtest.h"

#include "velo/logging.h"

#include "test_dir.h"

namespace fs = std::filesystem;

int main(int argc, char** argv) {
  velo::s_verbosity = velo::log_lvl::error;
  fs::current_path(VELO_TEST_EXECUTION_DIR);

  ::testing::InitGoogleTest(&argc, argv);
  auto test_result = RUN_ALL_TESTS();

  return test_result;
}
