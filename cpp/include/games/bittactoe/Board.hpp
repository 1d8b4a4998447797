#pragma once

#include "games/bittactoe/BasicTypes.hpp"
#include "games/bittactoe/Constants.hpp"

#include <compare>
#include <cstddef>
#include <functional>
#include <optional>

namespace bittactoe {

/*
 * Occupancy of both marks, as two masks of OR'ed Square values.
 *
 * Board is an immutable value: make_move() returns a new Board and leaves *this untouched.
 *
 * Invariants: xboard() & oboard() == 0, and every set bit belongs to some occupied Square.
 */
class Board {
 public:
  Board() = default;

  auto operator<=>(const Board& other) const = default;
  size_t hash() const;

  mask_t xboard() const { return xboard_; }
  mask_t oboard() const { return oboard_; }
  mask_t mask(Mark mark) const { return mark == Mark::Cross ? xboard_ : oboard_; }

  std::optional<Mark> at(Square square) const;
  bool is_occupied(Square square) const { return (to_mask(square) & (xboard_ | oboard_)) != 0; }
  int num_occupied() const;

  /*
   * Returns the mark that has completed a triple, along with that triple. Cross is checked first.
   * If a mark has somehow completed more than one triple, the one with the lowest Triple index is
   * reported. Neither case is reachable through legal play.
   */
  std::optional<Winner> calculate_winner() const;

  // Throws OccupiedSquareError if either mark holds square.
  void check_index(Square square) const;

  // Throws OccupiedSquareError if either mark holds square.
  Board make_move(Mark mark, Square square) const;

 private:
  // Returns the highest-order complete triple in mask, if any.
  static std::optional<Triple> find_triple(mask_t mask);

  mask_t xboard_ = 0;
  mask_t oboard_ = 0;
};

}  // namespace bittactoe

namespace std {

template <>
struct hash<bittactoe::Board> {
  size_t operator()(const bittactoe::Board& board) const { return board.hash(); }
};

}  // namespace std

#include "inline/games/bittactoe/Board.inl"
