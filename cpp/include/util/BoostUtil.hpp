#pragma once

#include <boost/program_options.hpp>

#include <string>
#include <vector>

/*
 * Command-line plumbing shared by bittactoe_replay and the unit-test launcher.
 *
 * Each component describes its own options with a plain boost options_description (see
 * util::Logging::Params and bittactoe::Replay::Params); main() merges them under one caption and
 * hands the result to parse_args().
 */
namespace boost_util {

namespace program_options {

/*
 * An options_description sized to the terminal, so that --help wraps at the screen edge.
 */
boost::program_options::options_description make_options_description(const std::string& caption);

/*
 * Adds --help/-h to desc.
 */
void add_help_option(boost::program_options::options_description& desc);

/*
 * True if argv contains --help or -h. Call before parse_args() when desc has required options,
 * since a bare --help would otherwise fail the required-option check.
 */
bool help_requested(int argc, const char* const* argv);

/*
 * Stores and notifies the values of argv against desc. Every boost parse error (unknown option,
 * missing required option, bad value) is rethrown as util::CleanException.
 */
boost::program_options::variables_map parse_args(
  const boost::program_options::options_description& desc, int argc, const char* const* argv);

boost::program_options::variables_map parse_args(
  const boost::program_options::options_description& desc, const std::vector<std::string>& args);

}  // namespace program_options

}  // namespace boost_util

#include "inline/util/BoostUtil.inl"
