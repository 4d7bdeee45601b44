#ifndef __AIC_SESSION_STORE_HPP__
#define __AIC_SESSION_STORE_HPP__

#include "Headers.hpp"

namespace aic {
/**
 * @brief What survives an aic restart: which tools can resume their own
 * conversation, and the tool the user last worked with.
 */
struct SessionState {
  string defaultTool;
  set<string> sessionTools;
};

/**
 * @brief Reads and writes SessionState as a small JSON file.
 */
class SessionStore {
 public:
  explicit SessionStore(const string& _path) : path(_path) {}

  static string defaultPath() { return GetConfigDirectory() + "/state.json"; }

  /**
   * @brief Returns the saved state, or an empty one if the file is missing
   * or unreadable.
   */
  SessionState load() const;

  /** @return false (after logging why) if the file could not be written. */
  bool save(const SessionState& state) const;

  const string& getPath() const { return path; }

 protected:
  string path;
};
}  // namespace aic

#endif  // __AIC_SESSION_STORE_HPP__
