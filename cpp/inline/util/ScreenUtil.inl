#include "util/ScreenUtil.hpp"

#include <sys/ioctl.h>

#include <unistd.h>

namespace util {

inline int get_screen_width() {
  static const int kWidth = [] {
    winsize ws{};
    bool is_tty = ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0;
    return (is_tty && ws.ws_col > 0) ? int(ws.ws_col) : kDefaultScreenWidth;
  }();
  return kWidth;
}

}  // namespace util
