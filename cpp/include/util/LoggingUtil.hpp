#pragma once

#include "util/CppUtil.hpp"

#include <boost/program_options/options_description.hpp>
#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

#include <string>

/*
 * LOG_TRACE() .. LOG_ERROR() take {}-style format strings:
 *
 * LOG_INFO("{} plays {}", "X", "B2");
 *
 * Statements below SPDLOG_ACTIVE_LEVEL vanish at compile time. The default level is info; the
 * BITTACTOE_ENABLE_DEBUG_LOGGING cmake option lowers it to trace.
 *
 * Format arguments are passed as strings (to_str(square), not square) so that the lines work
 * whether spdlog was built against fmt or std::format.
 */
#define BITTACTOE_LOG(SPDLOG_MACRO, ...) \
  do {                                   \
    USE_UNEVALUATED(__VA_ARGS__);        \
    SPDLOG_MACRO(__VA_ARGS__);           \
  } while (0)

#define LOG_TRACE(...) BITTACTOE_LOG(SPDLOG_TRACE, __VA_ARGS__)
#define LOG_DEBUG(...) BITTACTOE_LOG(SPDLOG_DEBUG, __VA_ARGS__)
#define LOG_INFO(...) BITTACTOE_LOG(SPDLOG_INFO, __VA_ARGS__)
#define LOG_WARN(...) BITTACTOE_LOG(SPDLOG_WARN, __VA_ARGS__)
#define LOG_ERROR(...) BITTACTOE_LOG(SPDLOG_ERROR, __VA_ARGS__)

namespace util {

struct Logging {
  struct Params {
    std::string log_filename;
    bool append_mode = false;
    bool omit_timestamps = false;

    // Defaults shown in --help are the current member values.
    boost::program_options::options_description make_options_description();
  };

  /*
   * Replaces the default spdlog logger with one that writes to stdout and, if
   * params.log_filename is set, to that file. Safe to call more than once.
   */
  static void init(const Params& params);
};

}  // namespace util
