#ifndef __AIC_PSEUDO_TERMINAL_CONSOLE_HPP__
#define __AIC_PSEUDO_TERMINAL_CONSOLE_HPP__

#include "Console.hpp"

namespace aic {
/**
 * @brief Console backed by this process's stdin/stdout.
 */
class PseudoTerminalConsole : public Console {
 public:
  PseudoTerminalConsole() : isTty(::isatty(STDIN_FILENO)), isRaw(false) {
    if (isTty) {
      tcgetattr(STDIN_FILENO, &terminal_backup);
    }
  }

  virtual ~PseudoTerminalConsole() {
    if (isRaw) {
      teardown();
    }
  }

  virtual void setup() {
    if (!isTty) {
      // Piped input has no line discipline to switch off
      return;
    }
    termios terminal_local;
    tcgetattr(STDIN_FILENO, &terminal_local);
    memcpy(&terminal_backup, &terminal_local, sizeof(struct termios));
    cfmakeraw(&terminal_local);
    tcsetattr(STDIN_FILENO, TCSANOW, &terminal_local);
    isRaw = true;
  }

  virtual void teardown() {
    if (!isTty) {
      return;
    }
    tcsetattr(STDIN_FILENO, TCSANOW, &terminal_backup);
    isRaw = false;
  }

  virtual TerminalSize getTerminalSize() {
    winsize win;
    TerminalSize size;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &win) == 0 && win.ws_row > 0 &&
        win.ws_col > 0) {
      size.rows = win.ws_row;
      size.cols = win.ws_col;
      size.xpixel = win.ws_xpixel;
      size.ypixel = win.ws_ypixel;
    }
    return size;
  }

  virtual int getInputFd() { return STDIN_FILENO; }

  virtual int getFd() { return STDOUT_FILENO; }

 protected:
  bool isTty;
  bool isRaw;
  /** @brief Terminal state saved by `setup()` for `teardown()`. */
  termios terminal_backup;
};
}  // namespace aic

#endif  // __AIC_PSEUDO_TERMINAL_CONSOLE_HPP__
