#include "util/GTestUtil.hpp"

#include "util/BoostUtil.hpp"
#include "util/LoggingUtil.hpp"

#include <boost/program_options.hpp>

#include <iostream>

/*
 * InitGoogleTest() strips the --gtest_* flags from argv, so it runs before parse_args(), which
 * rejects anything it does not know. On --help/-h, gtest prints its own flags after ours and
 * RUN_ALL_TESTS() returns without running anything.
 */
int launch_gtest(int argc, char** argv) {
  namespace po2 = boost_util::program_options;

  util::Logging::Params log_params;
  log_params.omit_timestamps = true;

  auto desc = po2::make_options_description("Test options");
  po2::add_help_option(desc);
  desc.add(log_params.make_options_description());

  if (po2::help_requested(argc, argv)) {
    std::cout << desc << std::endl;
  }

  testing::InitGoogleTest(&argc, argv);
  po2::parse_args(desc, argc, argv);
  util::Logging::init(log_params);

  return RUN_ALL_TESTS();
}
