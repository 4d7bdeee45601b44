#ifndef __AIC_HEADERS__
#define __AIC_HEADERS__

#if __FreeBSD__
#define _WITH_GETLINE
#endif

#if __APPLE__
#include <sys/ucred.h>
#include <util.h>
#elif __FreeBSD__
#include <libutil.h>
#elif __NetBSD__  // do not need pty.h on NetBSD
#include <util.h>
#else
#include <pty.h>
#endif

#include <fcntl.h>
#include <paths.h>
#include <pwd.h>
#include <signal.h>
#include <sys/ioctl.h>
#include <sys/select.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

#include <errno.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <ctime>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <regex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "easylogging++.h"
#include "sago/platform_folders.h"
#include "ust.hpp"

using namespace std;
namespace fs = std::filesystem;

// Control byte (Ctrl+]) that ends an attach session.  Never forwarded.
const char DETACH_KEY = 0x1d;

// ManagedProcess defaults
const int64_t DEFAULT_RESPONSE_TIMEOUT_MS = 3000;
const int64_t DEFAULT_STARTUP_TIMEOUT_MS = 60000;
const int64_t DEFAULT_STARTUP_GRACE_MS = 5000;

// Captures shorter than this (after sanitizing) are not worth recording.
const int MIN_MEANINGFUL_CAPTURE_LENGTH = 50;

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

inline int GetErrno() { return errno; }

inline void SetErrno(int e) { errno = e; }

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

#ifndef AIC_VERSION
#define AIC_VERSION "unknown"
#endif

namespace aic {
template <typename Out>
inline void split(const std::string &s, char delim, Out result) {
  std::stringstream ss;
  ss.str(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    *(result++) = item;
  }
}

inline std::vector<std::string> split(const std::string &s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

/**
 * @brief Splits on any run of spaces or tabs, dropping empty tokens.
 */
inline std::vector<std::string> splitWhitespace(const std::string &s) {
  std::vector<std::string> elems;
  std::stringstream ss(s);
  std::string item;
  while (ss >> item) {
    elems.push_back(item);
  }
  return elems;
}

inline int replaceAll(std::string &str, const std::string &from,
                      const std::string &to) {
  if (from.empty()) return 0;
  int retval = 0;
  size_t start_pos = 0;
  while ((start_pos = str.find(from, start_pos)) != std::string::npos) {
    retval++;
    str.replace(start_pos, from.length(), to);
    start_pos += to.length();  // In case 'to' contains 'from', like replacing
                               // 'x' with 'yx'
  }
  return retval;
}

inline std::string trim(const std::string &s) {
  const char *whitespace = " \t\r\n\f\v";
  auto first = s.find_first_not_of(whitespace);
  if (first == string::npos) {
    return string();
  }
  auto last = s.find_last_not_of(whitespace);
  return s.substr(first, last - first + 1);
}

inline string GetTempDirectory() {
  string tmpDir = _PATH_TMP;
  return tmpDir;
}

/** @brief Directory holding aic's config and state files. */
inline string GetConfigDirectory() { return sago::getConfigHome() + "/aic"; }

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}

inline void InterruptSignalHandler(int signum) {
  STERROR << "Got interrupt";
  CLOG(INFO, "stdout") << endl
                       << "Got interrupt (perhaps ctrl+c?).  Exiting." << endl;
  ::exit(signum);
}
}  // namespace aic

#endif
