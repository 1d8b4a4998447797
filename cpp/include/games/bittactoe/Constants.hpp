#pragma once

#include <cstdint>

namespace bittactoe {

using mask_t = uint32_t;
const int kBoardDimension = 3;
const int kNumCells = kBoardDimension * kBoardDimension;
const int kNumTriples = 8;

// Each triple owns a 4-bit slot of a mask_t, starting from the most significant bit.
const int kTripleSlotWidth = 4;

}  // namespace bittactoe
