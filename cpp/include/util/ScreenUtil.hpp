#pragma once

namespace util {

// Column count used when stdout is not a terminal (pipes, ctest).
constexpr int kDefaultScreenWidth = 80;

// Width of the terminal on stdout, measured once.
int get_screen_width();

}  // namespace util

#include "inline/util/ScreenUtil.inl"
