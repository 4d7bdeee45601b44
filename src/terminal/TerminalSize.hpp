#ifndef __AIC_TERMINAL_SIZE__
#define __AIC_TERMINAL_SIZE__

#include "Headers.hpp"

namespace aic {
/**
 * @brief Window geometry shared by the real terminal and every pty.
 */
struct TerminalSize {
  int rows;
  int cols;
  int xpixel;
  int ypixel;

  TerminalSize() : rows(24), cols(80), xpixel(0), ypixel(0) {}
  TerminalSize(int _rows, int _cols)
      : rows(_rows), cols(_cols), xpixel(0), ypixel(0) {}

  bool operator==(const TerminalSize& other) const {
    return rows == other.rows && cols == other.cols &&
           xpixel == other.xpixel && ypixel == other.ypixel;
  }
  bool operator!=(const TerminalSize& other) const {
    return !(*this == other);
  }

  winsize toWinsize() const {
    winsize w;
    w.ws_row = rows;
    w.ws_col = cols;
    w.ws_xpixel = xpixel;
    w.ws_ypixel = ypixel;
    return w;
  }
};

inline std::ostream& operator<<(std::ostream& os, const TerminalSize& size) {
  os << size.cols << "x" << size.rows;
  return os;
}
}  // namespace aic

#endif  // __AIC_TERMINAL_SIZE__
