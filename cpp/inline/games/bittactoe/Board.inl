#include "games/bittactoe/Board.hpp"

#include "games/bittactoe/OccupiedSquareError.hpp"
#include "util/Asserts.hpp"

#include <bit>

namespace bittactoe {

inline size_t Board::hash() const { return (size_t(xboard_) << 32) + oboard_; }

inline std::optional<Mark> Board::at(Square square) const {
  mask_t m = to_mask(square);
  if (xboard_ & m) return Mark::Cross;
  if (oboard_ & m) return Mark::Naught;
  return std::nullopt;
}

inline int Board::num_occupied() const {
  // Every square sets exactly one bit in the three row groups.
  constexpr mask_t kRowBits = 0xEEE00000;
  return std::popcount((xboard_ | oboard_) & kRowBits);
}

inline std::optional<Triple> Board::find_triple(mask_t mask) {
  // Bit k+1 survives iff bits k, k+1, k+2 are all set. Groups are separated by a clear bit, so
  // this only happens within a single triple's group.
  mask_t candidate = mask & (mask << 1) & (mask >> 1);
  if (!candidate) return std::nullopt;

  // The middle bit of group k sits at position 30 - 4k.
  return make_triple((std::countl_zero(candidate) - 1) / kTripleSlotWidth);
}

inline std::optional<Winner> Board::calculate_winner() const {
  if (auto triple = find_triple(xboard_)) {
    return Winner{Mark::Cross, *triple};
  }
  if (auto triple = find_triple(oboard_)) {
    return Winner{Mark::Naught, *triple};
  }
  return std::nullopt;
}

inline void Board::check_index(Square square) const {
  if (is_occupied(square)) {
    throw OccupiedSquareError(square);
  }
}

inline Board Board::make_move(Mark mark, Square square) const {
  check_index(square);

  Board board = *this;
  if (mark == Mark::Cross) {
    board.xboard_ |= to_mask(square);
  } else {
    board.oboard_ |= to_mask(square);
  }
  DEBUG_ASSERT((board.xboard_ & board.oboard_) == 0, "Overlapping masks {:#010x} {:#010x}",
               board.xboard_, board.oboard_);
  return board;
}

}  // namespace bittactoe
