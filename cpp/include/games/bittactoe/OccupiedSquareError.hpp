#pragma once

#include "games/bittactoe/BasicTypes.hpp"
#include "util/Exception.hpp"

namespace bittactoe {

/*
 * Thrown when a move targets a square that either mark already holds. The board (or game) the move
 * was attempted on is left as it was, so the same player can retry with a different square.
 */
class OccupiedSquareError : public util::CleanException {
 public:
  explicit OccupiedSquareError(Square square)
      : util::CleanException("{} is currently occupied", square), square_(square) {}

  Square square() const { return square_; }

 private:
  Square square_;
};

}  // namespace bittactoe
