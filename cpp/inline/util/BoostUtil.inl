#include "util/BoostUtil.hpp"

#include "util/Exception.hpp"
#include "util/ScreenUtil.hpp"

#include <string_view>

namespace boost_util {

namespace program_options {

namespace detail {

template <typename Parser>
boost::program_options::variables_map store_and_notify(
  Parser&& parser, const boost::program_options::options_description& desc) {
  namespace po = boost::program_options;

  po::variables_map vm;
  try {
    po::store(parser.options(desc).run(), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    throw util::CleanException("{}", e.what());
  }
  return vm;
}

}  // namespace detail

inline boost::program_options::options_description make_options_description(
  const std::string& caption) {
  unsigned line_length = util::get_screen_width() - 1;
  return boost::program_options::options_description(caption, line_length, line_length / 2);
}

inline void add_help_option(boost::program_options::options_description& desc) {
  desc.add_options()("help,h", "print this help message and exit");
}

inline bool help_requested(int argc, const char* const* argv) {
  for (int i = 1; i < argc; ++i) {
    std::string_view arg(argv[i]);
    if (arg == "--help" || arg == "-h") return true;
  }
  return false;
}

inline boost::program_options::variables_map parse_args(
  const boost::program_options::options_description& desc, int argc, const char* const* argv) {
  return detail::store_and_notify(boost::program_options::command_line_parser(argc, argv), desc);
}

inline boost::program_options::variables_map parse_args(
  const boost::program_options::options_description& desc, const std::vector<std::string>& args) {
  return detail::store_and_notify(boost::program_options::command_line_parser(args), desc);
}

}  // namespace program_options

}  // namespace boost_util
