#include "util/LoggingUtil.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace util {

namespace {

constexpr const char* kLoggerName = "bittactoe";
constexpr const char* kTimestampedPattern = "%Y-%m-%d %H:%M:%S.%e %^%-5l%$ %v";
constexpr const char* kPlainPattern = "%v";

}  // namespace

boost::program_options::options_description Logging::Params::make_options_description() {
  namespace po = boost::program_options;

  po::options_description desc = boost_util::program_options::make_options_description("Logging");
  desc.add_options()
    ("log-filename", po::value<std::string>(&log_filename)->default_value(log_filename),
     "also write the log to this file")
    ("log-append-mode",
     po::value<bool>(&append_mode)->default_value(append_mode)->implicit_value(true),
     "append to --log-filename instead of truncating it")
    ("omit-timestamps",
     po::value<bool>(&omit_timestamps)->default_value(omit_timestamps)->implicit_value(true),
     "log bare messages (--omit-timestamps=false to restore timestamps)");
  return desc;
}

void Logging::init(const Params& params) {
  const char* pattern = params.omit_timestamps ? kPlainPattern : kTimestampedPattern;

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!params.log_filename.empty()) {
    bool truncate = !params.append_mode;
    sinks.push_back(
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(params.log_filename, truncate));
  }

  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(pattern);

  // Level filtering happens at compile time via SPDLOG_ACTIVE_LEVEL.
  logger->set_level(spdlog::level::trace);
  logger->flush_on(spdlog::level::warn);

  spdlog::set_default_logger(logger);
}

}  // namespace util
