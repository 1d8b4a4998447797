#include "games/bittactoe/BasicTypes.hpp"
#include "games/bittactoe/Board.hpp"
#include "games/bittactoe/Game.hpp"
#include "games/bittactoe/IO.hpp"
#include "games/bittactoe/OccupiedSquareError.hpp"
#include "games/bittactoe/Replay.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/GTestUtil.hpp"

#include <gtest/gtest.h>

#include <bit>
#include <format>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

/*
 * Tests the bittactoe rules engine.
 */

using namespace bittactoe;

namespace {

// Bits of the 3-bit group owned by triple t.
mask_t group_bits(Triple t) {
  int middle = 30 - kTripleSlotWidth * static_cast<int>(t);
  return mask_t(0x7) << (middle - 1);
}

bool on_triple(Square s, Triple t) {
  for (Square x : squares_of(t)) {
    if (x == s) return true;
  }
  return false;
}

// Straightforward reference for Board::calculate_winner(), quirks included: Cross before Naught,
// lowest Triple index first.
std::optional<Winner> reference_winner(const Board& board) {
  for (Mark mark : {Mark::Cross, Mark::Naught}) {
    for (int i = 0; i < kNumTriples; ++i) {
      Triple t = make_triple(i);
      bool complete = true;
      for (Square s : squares_of(t)) {
        complete &= board.at(s) == mark;
      }
      if (complete) return Winner{mark, t};
    }
  }
  return std::nullopt;
}

Game play(Game game, const std::vector<Square>& squares) {
  for (Square s : squares) {
    game = game.make_move(s);
  }
  return game;
}

Board play(Board board, Mark mark, const std::vector<Square>& squares) {
  for (Square s : squares) {
    board = board.make_move(mark, s);
  }
  return board;
}

// B2(X), A2(O), B1(X), B3(O), C1(X), C3(O), A3(X)
const std::vector<Square> kDiag2Moves = {Square::B2, Square::A2, Square::B1, Square::B3,
                                         Square::C1, Square::C3, Square::A3};

}  // namespace

TEST(Mark, other) {
  EXPECT_EQ(other(Mark::Cross), Mark::Naught);
  EXPECT_EQ(other(Mark::Naught), Mark::Cross);
  for (Mark mark : {Mark::Cross, Mark::Naught}) {
    EXPECT_EQ(other(other(mark)), mark);
  }
}

TEST(Mark, names) {
  EXPECT_STREQ(to_str(Mark::Cross), "X");
  EXPECT_STREQ(to_str(Mark::Naught), "O");
  EXPECT_EQ(mark_name(Mark::Cross), "Cross");
  EXPECT_EQ(mark_name(Mark::Naught), "Naught");
  EXPECT_EQ(std::format("{}", Mark::Naught), "O");

  EXPECT_EQ(parse_mark("x"), Mark::Cross);
  EXPECT_EQ(parse_mark("O"), Mark::Naught);
  EXPECT_EQ(parse_mark("naught"), Mark::Naught);
  EXPECT_EQ(parse_mark("Cross"), Mark::Cross);
  EXPECT_EQ(parse_mark("Z"), std::nullopt);
  EXPECT_EQ(parse_mark(""), std::nullopt);
}

TEST(Square, values) {
  EXPECT_EQ(to_mask(Square::A1), 0x80080080u);
  EXPECT_EQ(to_mask(Square::A2), 0x40008000u);
  EXPECT_EQ(to_mask(Square::A3), 0x20000808u);
  EXPECT_EQ(to_mask(Square::B1), 0x08040000u);
  EXPECT_EQ(to_mask(Square::B2), 0x04004044u);
  EXPECT_EQ(to_mask(Square::B3), 0x02000400u);
  EXPECT_EQ(to_mask(Square::C1), 0x00820002u);
  EXPECT_EQ(to_mask(Square::C2), 0x00402000u);
  EXPECT_EQ(to_mask(Square::C3), 0x00200220u);
}

TEST(Square, bit_layout) {
  mask_t all_groups = 0;
  for (int i = 0; i < kNumTriples; ++i) {
    all_groups |= group_bits(make_triple(i));
  }

  for (Square s : kAllSquares) {
    // no stray bits outside the triple groups
    EXPECT_EQ(to_mask(s) & ~all_groups, 0u) << s;

    for (int i = 0; i < kNumTriples; ++i) {
      Triple t = make_triple(i);
      mask_t bits = to_mask(s) & group_bits(t);
      if (on_triple(s, t)) {
        EXPECT_EQ(std::popcount(bits), 1) << s << " " << t;
      } else {
        EXPECT_EQ(bits, 0u) << s << " " << t;
      }
    }
  }

  for (int i = 0; i < kNumTriples; ++i) {
    Triple t = make_triple(i);
    mask_t combined = 0;
    for (Square s : squares_of(t)) {
      combined |= to_mask(s) & group_bits(t);
    }
    EXPECT_EQ(combined, group_bits(t)) << t;
  }
}

TEST(Square, names) {
  for (Square s : kAllSquares) {
    std::string name = to_str(s);
    EXPECT_EQ(parse_square(name), s);
    EXPECT_EQ(name[0], 'A' + row_of(s));
    EXPECT_EQ(name[1], '1' + col_of(s));
    EXPECT_EQ(square_at(row_of(s), col_of(s)), s);
  }
  EXPECT_EQ(parse_square("b2"), Square::B2);
  EXPECT_EQ(parse_square("D1"), std::nullopt);
  EXPECT_EQ(parse_square("A"), std::nullopt);
  EXPECT_EQ(std::format("{}", Square::C3), "C3");
  EXPECT_THROW(square_at(3, 0), util::ReleaseAssertionError);
}

TEST(Triple, make_triple) {
  EXPECT_EQ(make_triple(0), Triple::RowA);
  EXPECT_EQ(make_triple(3), Triple::Col1);
  EXPECT_EQ(make_triple(6), Triple::Diag1);
  EXPECT_EQ(make_triple(7), Triple::Diag2);
  EXPECT_EQ(to_str(Triple::Col2), "Col2");
  EXPECT_EQ(std::format("{}", Triple::RowC), "RowC");
}

TEST(Triple, invalid_index) {
  EXPECT_THROW(make_triple(8), util::ReleaseAssertionError);
  EXPECT_THROW(make_triple(-1), util::ReleaseAssertionError);
  EXPECT_THROW(make_triple(256), util::ReleaseAssertionError);
}

TEST(Board, empty) {
  Board board;
  EXPECT_EQ(board.xboard(), 0u);
  EXPECT_EQ(board.oboard(), 0u);
  EXPECT_EQ(board.num_occupied(), 0);
  EXPECT_EQ(board.calculate_winner(), std::nullopt);
  for (Square s : kAllSquares) {
    EXPECT_FALSE(board.is_occupied(s));
    EXPECT_EQ(board.at(s), std::nullopt);
    EXPECT_NO_THROW(board.check_index(s));
  }
}

TEST(Board, make_move) {
  Board board = play(Board(), Mark::Naught, {Square::A1, Square::C3});
  board = board.make_move(Mark::Cross, Square::B2);

  for (Mark mark : {Mark::Cross, Mark::Naught}) {
    for (Square s : kAllSquares) {
      if (board.is_occupied(s)) continue;

      Board next = board.make_move(mark, s);
      EXPECT_EQ(next.mask(mark), board.mask(mark) | to_mask(s));
      EXPECT_EQ(next.mask(other(mark)), board.mask(other(mark)));
      EXPECT_EQ(next.at(s), mark);
      EXPECT_EQ(next.num_occupied(), board.num_occupied() + 1);
    }
  }
}

TEST(Board, occupied) {
  const Board board =
    Board().make_move(Mark::Cross, Square::B2).make_move(Mark::Naught, Square::A3);
  const Board copy = board;

  for (Square s : {Square::B2, Square::A3}) {
    for (Mark mark : {Mark::Cross, Mark::Naught}) {
      try {
        board.make_move(mark, s);
        FAIL() << "expected OccupiedSquareError for " << s;
      } catch (const OccupiedSquareError& e) {
        EXPECT_EQ(e.square(), s);
      }
    }
    EXPECT_THROW(board.check_index(s), OccupiedSquareError);
  }
  EXPECT_EQ(board, copy);
}

TEST(Board, every_triple) {
  for (Mark mark : {Mark::Cross, Mark::Naught}) {
    for (int i = 0; i < kNumTriples; ++i) {
      Triple t = make_triple(i);
      const auto& squares = squares_of(t);
      Board board = play(Board(), mark, {squares.begin(), squares.end()});
      EXPECT_EQ(board.calculate_winner(), (Winner{mark, t})) << t;
    }
  }
}

TEST(Board, cross_checked_first) {
  Board board = play(Board(), Mark::Naught, {Square::A1, Square::A2, Square::A3});
  board = play(board, Mark::Cross, {Square::C1, Square::C2, Square::C3});
  EXPECT_EQ(board.calculate_winner(), (Winner{Mark::Cross, Triple::RowC}));
}

TEST(Board, lowest_index_triple_reported) {
  // RowB and Col1 share B1
  Board board =
    play(Board(), Mark::Cross, {Square::A1, Square::B1, Square::C1, Square::B2, Square::B3});
  EXPECT_EQ(board.calculate_winner(), (Winner{Mark::Cross, Triple::RowB}));
}

// Walks every legal move sequence, without stopping at wins.
class BoardWalk : public testing::Test {
 protected:
  void walk(const Board& board, Mark mark, mask_t expected_x, mask_t expected_o) {
    ++num_visited_;
    ASSERT_EQ(board.xboard() & board.oboard(), 0u);
    ASSERT_EQ(board.xboard(), expected_x);
    ASSERT_EQ(board.oboard(), expected_o);
    ASSERT_EQ(board.calculate_winner(), reference_winner(board));

    for (Square s : kAllSquares) {
      if (board.is_occupied(s)) continue;
      Board next = board.make_move(mark, s);
      if (mark == Mark::Cross) {
        walk(next, other(mark), expected_x | to_mask(s), expected_o);
      } else {
        walk(next, other(mark), expected_x, expected_o | to_mask(s));
      }
    }
  }

  int num_visited_ = 0;
};

TEST_F(BoardWalk, all_sequences) {
  walk(Board(), Mark::Cross, 0, 0);
  EXPECT_EQ(num_visited_, 986410);  // sum over k of 9!/(9-k)!
}

TEST(Game, default_state) {
  Game game;
  EXPECT_EQ(game.current_mark(), Mark::Cross);
  EXPECT_EQ(game.board(), Board());
  EXPECT_EQ(game, Game(Mark::Cross));

  Game naught_first(Mark::Naught);
  EXPECT_EQ(naught_first.current_mark(), Mark::Naught);
  EXPECT_EQ(naught_first.board(), Board());
}

TEST(Game, make_move_ok) {
  Game game;
  Game next = game.make_move(Square::A2);
  EXPECT_EQ(next.current_mark(), Mark::Naught);
  EXPECT_EQ(next.board().at(Square::A2), Mark::Cross);
  EXPECT_EQ(game, Game());
}

TEST(Game, make_move_err) {
  Game game = Game().make_move(Square::B2);
  try {
    game.make_move(Square::B2);
    FAIL() << "expected OccupiedSquareError";
  } catch (const OccupiedSquareError& e) {
    EXPECT_EQ(e.square(), Square::B2);
    EXPECT_STREQ(e.what(), "B2 is currently occupied");
  }

  // same player retries
  EXPECT_EQ(game.current_mark(), Mark::Naught);
  Game retry = game.make_move(Square::A1);
  EXPECT_EQ(retry.board().at(Square::A1), Mark::Naught);
}

TEST(Game, turn_alternation) {
  Game game(Mark::Naught);
  Mark expected = Mark::Naught;
  for (Square s : {Square::C2, Square::A1, Square::B3, Square::A3}) {
    EXPECT_EQ(game.current_mark(), expected);
    game = game.make_move(s);
    EXPECT_EQ(game.board().at(s), expected);
    expected = other(expected);
  }
}

TEST(Game, calculate_winner) {
  // | |O|X|
  // |X|X|O|
  // |X| |O|
  Game game = play(Game(), kDiag2Moves);

  EXPECT_EQ(IO::board_repr(game.board()),
            "| |O|X|\n"
            "|X|X|O|\n"
            "|X| |O|\n");
  EXPECT_EQ(game.calculate_winner(), (Winner{Mark::Cross, Triple::Diag2}));
}

TEST(Game, moves_after_win) {
  Game game = play(Game(), kDiag2Moves);
  Game next = game.make_move(Square::C2);
  EXPECT_EQ(next.board().at(Square::C2), Mark::Naught);
  EXPECT_EQ(next.calculate_winner(), (Winner{Mark::Cross, Triple::Diag2}));
}

TEST(Game, hash) {
  std::unordered_set<Game> games;
  games.insert(Game());
  games.insert(Game(Mark::Naught));
  games.insert(Game().make_move(Square::A1));
  games.insert(Game().make_move(Square::A1));
  EXPECT_EQ(games.size(), 3u);

  Game a = Game().make_move(Square::A1).make_move(Square::B2);
  Game b = Game().make_move(Square::A1).make_move(Square::B2);
  EXPECT_EQ(std::hash<Game>{}(a), std::hash<Game>{}(b));
}

TEST(Game, hash_separates_mark_to_move) {
  // Same boards, different mark to move: every game reached within three plies from either
  // starting mark must hash to its own bucket.
  std::vector<Game> frontier = {Game(Mark::Cross), Game(Mark::Naught)};
  std::unordered_set<Game> games(frontier.begin(), frontier.end());
  for (int ply = 0; ply < 3; ++ply) {
    std::vector<Game> next;
    for (const Game& game : frontier) {
      for (Square square : kAllSquares) {
        if (game.board().is_occupied(square)) continue;
        Game child = game.make_move(square);
        if (games.insert(child).second) next.push_back(child);
      }
    }
    frontier = std::move(next);
  }

  std::unordered_set<size_t> hashes;
  for (const Game& game : games) hashes.insert(game.hash());
  EXPECT_EQ(hashes.size(), games.size());
  EXPECT_NE(Game(Mark::Cross).hash(), Game(Mark::Naught).hash());
  EXPECT_NE(Game().hash(), Game().board().hash());
}

TEST(IO, print_state) {
  std::ostringstream ss;
  IO::print_state(ss, play(Game(), kDiag2Moves));
  EXPECT_EQ(ss.str(),
            "   1 2 3\n"
            "A | |O|X|\n"
            "B |X|X|O|\n"
            "C |X| |O|\n"
            "X wins (Diag2)\n");

  ss.str("");
  IO::print_state(ss, Game().make_move(Square::C1));
  EXPECT_EQ(ss.str(),
            "   1 2 3\n"
            "A | | | |\n"
            "B | | | |\n"
            "C |X| | |\n"
            "O to move\n");
}

TEST(Replay, parse_moves) {
  EXPECT_EQ(Replay::parse_moves("B2,a2,,c3"),
            std::vector<Square>({Square::B2, Square::A2, Square::C3}));
  EXPECT_EQ(Replay::parse_moves(""), std::vector<Square>());
  EXPECT_THROW(Replay::parse_moves("B2,Z9"), util::CleanException);
  EXPECT_EQ(Replay::parse_starting_mark("o"), Mark::Naught);
  EXPECT_THROW(Replay::parse_starting_mark("Q"), util::CleanException);
}

TEST(Replay, run) {
  Game game = Replay::run(Mark::Cross, kDiag2Moves);
  EXPECT_EQ(game, play(Game(), kDiag2Moves));
  EXPECT_EQ(game.current_mark(), Mark::Naught);

  EXPECT_THROW(Replay::run(Mark::Naught, {Square::A1, Square::A1}), OccupiedSquareError);
}

TEST(Replay, options) {
  Replay::Params params;
  auto desc = params.make_options_description();
  boost_util::program_options::parse_args(desc, std::vector<std::string>{"-m", "B2,A2", "-s", "O"});
  EXPECT_EQ(params.moves, "B2,A2");
  EXPECT_EQ(params.starting_mark, "O");

  Replay::Params defaults;
  auto defaults_desc = defaults.make_options_description();
  boost_util::program_options::parse_args(defaults_desc, std::vector<std::string>{"--moves=C3"});
  EXPECT_EQ(defaults.starting_mark, "X");

  std::vector<std::string> no_moves = {"-s", "X"};
  EXPECT_THROW(boost_util::program_options::parse_args(desc, no_moves), util::CleanException);
}

TEST(Replay, main) {
  auto run_main = [](std::vector<std::string> args) {
    args.insert(args.begin(), "bittactoe_replay");
    args.push_back("--omit-timestamps");
    std::vector<char*> argv;
    for (std::string& arg : args) argv.push_back(arg.data());
    return Replay::main(int(argv.size()), argv.data());
  };

  EXPECT_EQ(run_main({"--moves", "B2,A2,B1,B3,C1,C3,A3"}), 0);
  EXPECT_EQ(run_main({"-m", "B2,B2"}), 1);
  EXPECT_EQ(run_main({"-m", "B2,D4"}), 1);
  EXPECT_EQ(run_main({"-m", "B2", "-s", "Q"}), 1);
  EXPECT_EQ(run_main({"-s", "O"}), 1);
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
