#include "games/bittactoe/BasicTypes.hpp"

#include "util/Asserts.hpp"
#include "util/StringUtil.hpp"

#include <magic_enum/magic_enum.hpp>

namespace bittactoe {

namespace detail {

// Indexed by square_index()
constexpr const char* kSquareNames[kNumCells] = {"A1", "A2", "A3", "B1", "B2",
                                                 "B3", "C1", "C2", "C3"};

// Indexed by Triple
constexpr std::array<Square, kBoardDimension> kTripleSquares[kNumTriples] = {
  {Square::A1, Square::A2, Square::A3},  // RowA
  {Square::B1, Square::B2, Square::B3},  // RowB
  {Square::C1, Square::C2, Square::C3},  // RowC
  {Square::A1, Square::B1, Square::C1},  // Col1
  {Square::A2, Square::B2, Square::C2},  // Col2
  {Square::A3, Square::B3, Square::C3},  // Col3
  {Square::A1, Square::B2, Square::C3},  // Diag1
  {Square::A3, Square::B2, Square::C1},  // Diag2
};

}  // namespace detail

inline const char* to_str(Mark mark) { return mark == Mark::Cross ? "X" : "O"; }

inline std::string_view mark_name(Mark mark) { return magic_enum::enum_name(mark); }

inline std::optional<Mark> parse_mark(std::string_view s) {
  for (Mark mark : magic_enum::enum_values<Mark>()) {
    if (util::iequals(s, to_str(mark))) return mark;
  }
  return magic_enum::enum_cast<Mark>(s, magic_enum::case_insensitive);
}

inline int square_index(Square square) {
  switch (square) {
    case Square::A1: return 0;
    case Square::A2: return 1;
    case Square::A3: return 2;
    case Square::B1: return 3;
    case Square::B2: return 4;
    case Square::B3: return 5;
    case Square::C1: return 6;
    case Square::C2: return 7;
    case Square::C3: return 8;
  }
  throw util::Exception("Unknown square: {:#010x}", to_mask(square));
}

inline const char* to_str(Square square) { return detail::kSquareNames[square_index(square)]; }

inline std::optional<Square> parse_square(std::string_view s) {
  for (int i = 0; i < kNumCells; ++i) {
    if (util::iequals(s, detail::kSquareNames[i])) return kAllSquares[i];
  }
  return std::nullopt;
}

inline Square square_at(int row, int col) {
  RELEASE_ASSERT(row >= 0 && row < kBoardDimension && col >= 0 && col < kBoardDimension,
                 "Invalid square coordinates ({}, {})", row, col);
  return kAllSquares[row * kBoardDimension + col];
}

inline std::string_view to_str(Triple triple) { return magic_enum::enum_name(triple); }

static_assert(magic_enum::enum_count<Triple>() == kNumTriples);

inline Triple make_triple(int index) {
  RELEASE_ASSERT(index >= 0 && index < kNumTriples, "Invalid triple index: {}", index);
  return magic_enum::enum_value<Triple>(index);
}

inline const std::array<Square, kBoardDimension>& squares_of(Triple triple) {
  return detail::kTripleSquares[static_cast<int>(triple)];
}

inline std::ostream& operator<<(std::ostream& os, Mark mark) { return os << to_str(mark); }

inline std::ostream& operator<<(std::ostream& os, Square square) { return os << to_str(square); }

inline std::ostream& operator<<(std::ostream& os, Triple triple) { return os << to_str(triple); }

inline std::ostream& operator<<(std::ostream& os, const Winner& winner) {
  return os << std::format("({}, {})", winner.mark, winner.triple);
}

}  // namespace bittactoe
