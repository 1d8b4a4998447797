#pragma once

#include "games/bittactoe/Constants.hpp"

#include <magic_enum/magic_enum_format.hpp>

#include <array>
#include <compare>
#include <cstdint>
#include <format>
#include <optional>
#include <ostream>
#include <string_view>

namespace bittactoe {

enum class Mark : uint8_t { Cross, Naught };

/*
 * Bit encoding for the squares:
 *
 *      1  2  3
 *   A  .  .  .
 *   B  .  .  .
 *   C  .  .  .
 *
 * Triple k (see Triple below) owns bits [29-4k, 31-4k] of the mask. Each square sets, for every
 * triple it lies on, the bit of that triple's group matching its position within the triple.
 * Bits 28, 24, ..., 0 are never set, so the groups never touch each other. A mark has completed
 * triple k exactly when all 3 bits of group k are set in its mask.
 *
 * These values must not be renumbered.
 */
enum class Square : mask_t {
  A1 = 0x80080080,
  A2 = 0x40008000,
  A3 = 0x20000808,
  B1 = 0x08040000,
  B2 = 0x04004044,
  B3 = 0x02000400,
  C1 = 0x00820002,
  C2 = 0x00402000,
  C3 = 0x00200220,
};

// Diag1 is A1-B2-C3, Diag2 is A3-B2-C1.
enum class Triple : uint8_t { RowA, RowB, RowC, Col1, Col2, Col3, Diag1, Diag2 };

struct Winner {
  auto operator<=>(const Winner& other) const = default;

  Mark mark;
  Triple triple;
};

// Row-major: A1, A2, A3, B1, ...
constexpr std::array<Square, kNumCells> kAllSquares = {
  Square::A1, Square::A2, Square::A3, Square::B1, Square::B2,
  Square::B3, Square::C1, Square::C2, Square::C3};

constexpr Mark other(Mark mark) { return mark == Mark::Cross ? Mark::Naught : Mark::Cross; }

// "X" or "O"
const char* to_str(Mark mark);

// "Cross" or "Naught"
std::string_view mark_name(Mark mark);

// Accepts "X", "O", "Cross", "Naught", case-insensitively.
std::optional<Mark> parse_mark(std::string_view s);

constexpr mask_t to_mask(Square square) { return static_cast<mask_t>(square); }

// "A1" ... "C3"
const char* to_str(Square square);

// Accepts "A1" ... "C3", case-insensitively.
std::optional<Square> parse_square(std::string_view s);

// Position in kAllSquares
int square_index(Square square);
inline int row_of(Square square) { return square_index(square) / kBoardDimension; }
inline int col_of(Square square) { return square_index(square) % kBoardDimension; }

// 0 <= row, col < kBoardDimension, else RELEASE_ASSERT fails.
Square square_at(int row, int col);

// "RowA" ... "Diag2"
std::string_view to_str(Triple triple);

/*
 * Maps a triple index 0-7 to its Triple. Any other index means the Square bit layout has been
 * violated; that is a bug, so it fails a RELEASE_ASSERT instead of returning an error.
 */
Triple make_triple(int index);

const std::array<Square, kBoardDimension>& squares_of(Triple triple);

std::ostream& operator<<(std::ostream& os, Mark mark);
std::ostream& operator<<(std::ostream& os, Square square);
std::ostream& operator<<(std::ostream& os, Triple triple);
std::ostream& operator<<(std::ostream& os, const Winner& winner);

}  // namespace bittactoe

// Triple formats through magic_enum. Mark prints its symbol, and Square values are out of
// magic_enum's reflection range.
template <>
struct std::formatter<bittactoe::Mark> : std::formatter<std::string_view> {
  auto format(bittactoe::Mark mark, std::format_context& ctx) const {
    return std::formatter<std::string_view>::format(bittactoe::to_str(mark), ctx);
  }
};

template <>
struct std::formatter<bittactoe::Square> : std::formatter<std::string_view> {
  auto format(bittactoe::Square square, std::format_context& ctx) const {
    return std::formatter<std::string_view>::format(bittactoe::to_str(square), ctx);
  }
};

#include "inline/games/bittactoe/BasicTypes.inl"
