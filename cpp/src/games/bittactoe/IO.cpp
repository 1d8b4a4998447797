#include "games/bittactoe/IO.hpp"

#include <format>

namespace bittactoe {

namespace {

char symbol_at(const Board& board, int row, int col) {
  auto mark = board.at(square_at(row, col));
  return mark ? to_str(*mark)[0] : ' ';
}

}  // namespace

std::string IO::board_repr(const Board& board) {
  std::string repr;
  for (int row = 0; row < kBoardDimension; ++row) {
    repr += '|';
    for (int col = 0; col < kBoardDimension; ++col) {
      repr += symbol_at(board, row, col);
      repr += '|';
    }
    repr += '\n';
  }
  return repr;
}

void IO::print_state(std::ostream& os, const Game& game) {
  const Board& board = game.board();

  os << "   1 2 3\n";
  for (int row = 0; row < kBoardDimension; ++row) {
    os << char('A' + row) << ' ' << '|';
    for (int col = 0; col < kBoardDimension; ++col) {
      os << symbol_at(board, row, col) << '|';
    }
    os << '\n';
  }

  if (auto winner = game.calculate_winner()) {
    os << std::format("{} wins ({})\n", winner->mark, winner->triple);
  } else {
    os << std::format("{} to move\n", game.current_mark());
  }
}

}  // namespace bittactoe
