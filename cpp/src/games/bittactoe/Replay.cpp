#include "games/bittactoe/Replay.hpp"

#include "games/bittactoe/IO.hpp"
#include "games/bittactoe/OccupiedSquareError.hpp"
#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/LoggingUtil.hpp"
#include "util/StringUtil.hpp"

#include <boost/program_options.hpp>

#include <iostream>
#include <sstream>

namespace bittactoe {

boost::program_options::options_description Replay::Params::make_options_description() {
  namespace po = boost::program_options;

  po::options_description desc = boost_util::program_options::make_options_description("Replay");
  desc.add_options()
    ("moves,m", po::value<std::string>(&moves)->required(),
     "comma-separated squares to play in order, e.g. B2,A2,B1")
    ("starting-mark,s", po::value<std::string>(&starting_mark)->default_value(starting_mark),
     "mark that moves first (X or O)");
  return desc;
}

std::vector<Square> Replay::parse_moves(const std::string& moves) {
  std::vector<Square> squares;
  for (const std::string& token : util::split(moves, ',')) {
    if (token.empty()) continue;
    auto square = parse_square(token);
    CLEAN_ASSERT(square.has_value(), "Invalid square \"{}\"", token);
    squares.push_back(*square);
  }
  return squares;
}

Mark Replay::parse_starting_mark(const std::string& s) {
  auto mark = parse_mark(s);
  CLEAN_ASSERT(mark.has_value(), "Invalid mark \"{}\"", s);
  return *mark;
}

Game Replay::run(Mark starting_mark, const std::vector<Square>& moves) {
  Game game(starting_mark);
  for (Square square : moves) {
    game = game.make_move(square);
    if (auto winner = game.calculate_winner()) {
      LOG_DEBUG("{} has {} after {}", to_str(winner->mark), to_str(winner->triple),
                to_str(square));
    }
  }
  return game;
}

int Replay::main(int ac, char* av[]) {
  try {
    namespace po2 = boost_util::program_options;

    Params params;
    util::Logging::Params log_params;

    auto desc = po2::make_options_description("bittactoe_replay options");
    po2::add_help_option(desc);
    desc.add(params.make_options_description());
    desc.add(log_params.make_options_description());

    // --moves is required, so a bare --help would not survive parse_args()
    if (po2::help_requested(ac, av)) {
      std::cout << desc << std::endl;
      return 0;
    }

    po2::parse_args(desc, ac, av);
    util::Logging::init(log_params);

    Mark starting_mark = parse_starting_mark(params.starting_mark);
    std::vector<Square> moves = parse_moves(params.moves);

    Game game;
    try {
      game = run(starting_mark, moves);
    } catch (const OccupiedSquareError& e) {
      LOG_ERROR("Illegal move: {}", e.what());
      return 1;
    }

    std::ostringstream ss;
    IO::print_state(ss, game);
    for (const std::string& line : util::splitlines(ss.str())) {
      LOG_INFO("{}", line);
    }

    if (auto winner = game.calculate_winner()) {
      LOG_INFO("Winner: {} ({})", to_str(winner->mark), to_str(winner->triple));
    } else {
      LOG_INFO("No winner after {} moves", moves.size());
    }
  } catch (const util::CleanException& e) {
    LOG_ERROR("{}", e.what());
    return 1;
  }

  return 0;
}

}  // namespace bittactoe
