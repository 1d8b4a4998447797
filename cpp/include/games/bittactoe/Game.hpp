#pragma once

#include "games/bittactoe/BasicTypes.hpp"
#include "games/bittactoe/Board.hpp"

#include <boost/functional/hash.hpp>

#include <compare>
#include <cstddef>
#include <functional>
#include <optional>
#include <utility>

namespace bittactoe {

/*
 * A Board plus the mark whose turn it is.
 *
 * Like Board, Game is an immutable value. There is no game-over state: after a winning move,
 * make_move() keeps accepting moves onto empty squares. Callers that want to stop at a win should
 * check calculate_winner() after every move.
 */
class Game {
 public:
  Game() : Game(Mark::Cross) {}
  explicit Game(Mark starting_mark) : current_mark_(starting_mark) {}

  auto operator<=>(const Game& other) const = default;
  size_t hash() const {
    size_t h = board_.hash();
    boost::hash_combine(h, std::to_underlying(current_mark_));
    return h;
  }

  Mark current_mark() const { return current_mark_; }
  const Board& board() const { return board_; }

  /*
   * Places current_mark() on square and passes the turn to the other mark.
   *
   * Throws OccupiedSquareError if the square is taken. In that case no new Game exists, so the
   * turn stays with the same mark.
   */
  Game make_move(Square square) const;

  // Ignores whose turn it is.
  std::optional<Winner> calculate_winner() const { return board_.calculate_winner(); }

 private:
  Game(Mark current_mark, const Board& board) : current_mark_(current_mark), board_(board) {}

  Mark current_mark_;
  Board board_;
};

}  // namespace bittactoe

namespace std {

template <>
struct hash<bittactoe::Game> {
  size_t operator()(const bittactoe::Game& game) const { return game.hash(); }
};

}  // namespace std
