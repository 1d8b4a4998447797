#include "games/bittactoe/Game.hpp"

#include "games/bittactoe/OccupiedSquareError.hpp"
#include "util/LoggingUtil.hpp"

namespace bittactoe {

Game Game::make_move(Square square) const {
  try {
    Board board = board_.make_move(current_mark_, square);
    LOG_DEBUG("{} plays {}", to_str(current_mark_), to_str(square));
    return Game(other(current_mark_), board);
  } catch (const OccupiedSquareError& e) {
    LOG_DEBUG("{} rejected: {}", to_str(current_mark_), e.what());
    throw;
  }
}

}  // namespace bittactoe
