#include <iostream>
#include <string>
#include <vector>

#include "boost/program_options.hpp"

#include "velo/loader/dir.h"
#include "velo/logging.h"
#include "velo/process.h"

namespace bpo = boost::program_options;
using namespace velo;

int main(int ac, char** av) {
  auto c = batch_config{};
  auto cities = std::vector<std::string>{};
  auto verbosity = std::string{"info"};

  auto desc = bpo::options_description{"Options"};
  desc.add_options()  //
      ("help,h", "produce this help message")  //
      ("raw,r", bpo::value(&c.raw_root_)->default_value(c.raw_root_),
       "raw data root: <City>/trip_data/<month>/<month>-combined.csv and "
       "<City>/station_data/stations.csv")  //
      ("out,o", bpo::value(&c.cleaned_root_)->default_value(c.cleaned_root_),
       "cleaned data root")  //
      ("city,c", bpo::value(&cities)->composing(),
       "city to clean (repeatable), default: NYC Chicago Boston Capital")  //
      ("month,m", bpo::value(&c.month_)->default_value(c.month_),
       "month of the trip export, format: YYYYMM")  //
      ("min_duration",
       bpo::value(&c.clean_.min_duration_minutes_)
           ->default_value(c.clean_.min_duration_minutes_),
       "minimum trip duration in minutes (inclusive)")  //
      ("max_duration",
       bpo::value(&c.clean_.max_duration_minutes_)
           ->default_value(c.clean_.max_duration_minutes_),
       "maximum trip duration in minutes (inclusive)")  //
      ("strict_validation",
       bpo::bool_switch(&c.clean_.strict_validation_)->default_value(false),
       "treat schema validation failures as fatal for the city")  //
      ("verbosity,v", bpo::value(&verbosity)->default_value(verbosity),
       "log level: debug, info, error");
  auto const pos = bpo::positional_options_description{}.add("raw", 1);

  auto vm = bpo::variables_map{};
  try {
    bpo::store(
        bpo::command_line_parser(ac, av).options(desc).positional(pos).run(),
        vm);
    bpo::notify(vm);
    s_verbosity = parse_log_lvl(verbosity);
  } catch (std::exception const& e) {
    std::cerr << e.what() << "\n" << desc << "\n";
    return 1;
  }

  if (vm.count("help") != 0U) {
    std::cout << desc << "\n";
    return 0;
  }

  if (!cities.empty()) {
    c.cities_ = cities;
  }

  try {
    auto const raw = loader::make_dir(c.raw_root_);
    auto const result = process_all_cities(*raw, c);
    for (auto const& f : result.failed_) {
      std::cerr << f.message_ << "\n";
    }
    return result.ok() ? 0 : 1;
  } catch (std::exception const& e) {
    log(log_lvl::error, "velo-clean", "{}", e.what());
    return 1;
  }
}
