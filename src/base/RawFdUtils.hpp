#ifndef __AIC_RAW_FD_UTILS__
#define __AIC_RAW_FD_UTILS__

#include "Headers.hpp"

namespace aic {
/**
 * @brief Blocking and non-blocking helpers around POSIX read/write on ptys
 * and terminals.
 */
class RawFdUtils {
 public:
  /**
   * @brief Writes the entire buffer, retrying on EAGAIN/EINTR.
   * @throws ChannelIOError when the descriptor is invalid or closed.
   */
  static void writeAll(int fd, const char* buf, size_t count);

  /**
   * @brief Writes as much of the buffer as `fd` takes without blocking.
   * @return bytes written, -1 if the descriptor is full right now.
   * @throws ChannelIOError when the descriptor is invalid or closed.
   */
  static ssize_t writeAvailable(int fd, const char* buf, size_t count);

  /**
   * @brief Reads whatever is available (at most `maxBytes`) into `out`.
   * @return bytes read, 0 on EOF, -1 if nothing is available right now.
   * @throws ChannelIOError on a hard error other than EIO.
   */
  static ssize_t readAvailable(int fd, string* out, size_t maxBytes);

  static void setNonBlocking(int fd);
};
}  // namespace aic
#endif  // __AIC_RAW_FD_UTILS__
