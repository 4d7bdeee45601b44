#include "RawFdUtils.hpp"

#include "SupervisorErrors.hpp"

namespace aic {
void RawFdUtils::writeAll(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw ChannelIOError("Invalid file descriptor for writeAll");
  }
  if (count == 0) {
    return;
  }

  size_t bytesWritten = 0;
  do {
    ssize_t rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EINTR) {
        continue;
      }
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        // The tool is not draining its input; wait for room
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        continue;
      }
      STERROR << "Cannot write to fd " << fd << ": " << strerror(localErrno);
      throw ChannelIOError(string("Cannot write to terminal: ") +
                           strerror(localErrno));
    }
    if (rc == 0) {
      throw ChannelIOError("Cannot write to terminal: channel closed");
    }
    bytesWritten += rc;
  } while (bytesWritten != count);
}

ssize_t RawFdUtils::writeAvailable(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw ChannelIOError("Invalid file descriptor for writeAvailable");
  }
  if (count == 0) {
    return 0;
  }
  while (true) {
    ssize_t rc = ::write(fd, buf, count);
    if (rc > 0) {
      return rc;
    }
    if (rc == 0) {
      throw ChannelIOError("Cannot write to terminal: channel closed");
    }
    auto localErrno = GetErrno();
    if (localErrno == EINTR) {
      continue;
    }
    if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
      return -1;
    }
    throw ChannelIOError(string("Cannot write to terminal: ") +
                         strerror(localErrno));
  }
}

ssize_t RawFdUtils::readAvailable(int fd, string* out, size_t maxBytes) {
  if (fd < 0) {
    throw ChannelIOError("Invalid file descriptor for readAvailable");
  }
  out->resize(maxBytes);
  while (true) {
    ssize_t rc = ::read(fd, &(*out)[0], maxBytes);
    if (rc >= 0) {
      out->resize(rc);
      return rc;
    }
    auto localErrno = GetErrno();
    if (localErrno == EINTR) {
      continue;
    }
    out->clear();
    if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
      return -1;
    }
    if (localErrno == EIO) {
      // Linux reports EIO on a pty master once the child side is gone
      return 0;
    }
    throw ChannelIOError(string("Cannot read from terminal: ") +
                         strerror(localErrno));
  }
}

void RawFdUtils::setNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  FATAL_FAIL(flags);
  FATAL_FAIL(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}
}  // namespace aic
