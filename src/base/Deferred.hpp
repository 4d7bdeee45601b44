#ifndef __AIC_DEFERRED__
#define __AIC_DEFERRED__

#include "Headers.hpp"

namespace aic {
/**
 * @brief Single-shot result slot that is filled in later by the event loop.
 *
 * A deferred is settled at most once: the first call to `resolve()` or
 * `reject()` wins and every later call is ignored and returns false.
 */
template <typename T>
class Deferred {
 public:
  Deferred() : settled(false) {}

  bool isSettled() const { return settled; }

  bool isRejected() const { return settled && error != nullptr; }

  bool resolve(const T& v) {
    if (settled) {
      return false;
    }
    value = v;
    settled = true;
    return true;
  }

  bool reject(std::exception_ptr e) {
    if (settled) {
      return false;
    }
    error = e;
    settled = true;
    return true;
  }

  /**
   * @brief Returns the value, or rethrows the rejection.
   */
  const T& get() const {
    if (!settled) {
      throw std::logic_error("Tried to read a deferred that is still pending");
    }
    if (error) {
      std::rethrow_exception(error);
    }
    return value;
  }

 protected:
  bool settled;
  T value;
  std::exception_ptr error;
};
}  // namespace aic

#endif  // __AIC_DEFERRED__
