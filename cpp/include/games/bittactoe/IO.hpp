#pragma once

#include "games/bittactoe/Board.hpp"
#include "games/bittactoe/Game.hpp"

#include <ostream>
#include <string>

namespace bittactoe {

struct IO {
  /*
   * One line per row, A first:
   *
   * | |O|X|
   * |X|X|O|
   * |X| |O|
   */
  static std::string board_repr(const Board& board);

  /*
   * The board with row/column labels, followed by a status line: either "X to move", or the
   * winner, e.g. "X wins (Diag2)".
   */
  static void print_state(std::ostream& os, const Game& game);
};

}  // namespace bittactoe
