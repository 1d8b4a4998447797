#pragma once

#include "games/bittactoe/Game.hpp"

#include <boost/program_options/options_description.hpp>

#include <string>
#include <vector>

namespace bittactoe {

/*
 * Plays a fixed sequence of moves from a fresh Game. Backs the bittactoe_replay executable.
 */
struct Replay {
  struct Params {
    std::string moves;  // comma-separated squares, e.g. "B2,A2,B1"
    std::string starting_mark = "X";

    boost::program_options::options_description make_options_description();
  };

  // Throws util::CleanException on a malformed square or mark.
  static std::vector<Square> parse_moves(const std::string& moves);
  static Mark parse_starting_mark(const std::string& s);

  /*
   * Applies moves in order. Moves after a win are still applied. Throws OccupiedSquareError on the
   * first move onto a taken square.
   */
  static Game run(Mark starting_mark, const std::vector<Square>& moves);

  // Entry point of bittactoe_replay.
  static int main(int ac, char* av[]);
};

}  // namespace bittactoe
