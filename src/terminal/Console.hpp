#ifndef __AIC_CONSOLE_HPP__
#define __AIC_CONSOLE_HPP__

#include "Headers.hpp"
#include "RawFdUtils.hpp"
#include "SupervisorErrors.hpp"
#include "TerminalSize.hpp"

namespace aic {
/**
 * @brief The real terminal the user is sitting at.
 *
 * There is exactly one per aic process.  Raw mode is an exclusive resource:
 * only the holder of a `ConsoleRawModeGuard` may switch it.
 */
class Console {
 public:
  virtual ~Console() {}

  /** @brief Returns the current window geometry. */
  virtual TerminalSize getTerminalSize() = 0;
  /** @brief Switches input to raw (unbuffered, no line editing) mode. */
  virtual void setup() = 0;
  /** @brief Restores the input mode saved by `setup()`. */
  virtual void teardown() = 0;
  /** @brief Descriptor that delivers keystrokes. */
  virtual int getInputFd() = 0;
  /** @brief Descriptor that displays output. */
  virtual int getFd() = 0;

  virtual void write(const string& s) {
    RawFdUtils::writeAll(getFd(), s.data(), s.length());
  }

  const string& getRawModeOwner() const { return rawModeOwner; }

 protected:
  friend class ConsoleRawModeGuard;

  /** @brief Name of whoever holds raw mode right now, empty if nobody. */
  string rawModeOwner;
};

/**
 * @brief Scoped ownership of the console's raw mode.
 *
 * Construction fails with TerminalBusyError if someone else already owns the
 * console.  Destruction always restores the saved mode, whatever path the
 * owner leaves by.
 */
class ConsoleRawModeGuard {
 public:
  ConsoleRawModeGuard(shared_ptr<Console> _console, const string& owner)
      : console(_console) {
    if (!console->rawModeOwner.empty()) {
      throw TerminalBusyError("Terminal is already attached to " +
                              console->rawModeOwner);
    }
    console->rawModeOwner = owner;
    console->setup();
  }

  ~ConsoleRawModeGuard() {
    console->teardown();
    console->rawModeOwner.clear();
  }

 private:
  ConsoleRawModeGuard(const ConsoleRawModeGuard&) = delete;
  ConsoleRawModeGuard& operator=(const ConsoleRawModeGuard&) = delete;

  shared_ptr<Console> console;
};
}  // namespace aic

#endif  // __AIC_CONSOLE_HPP__
