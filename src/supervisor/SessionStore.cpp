#include "SessionStore.hpp"

#include "JsonLib.hpp"

namespace aic {
SessionState SessionStore::load() const {
  SessionState state;
  std::ifstream in(path);
  if (!in.good()) {
    VLOG(1) << "No saved session at " << path;
    return state;
  }
  try {
    json j = json::parse(in);
    if (j.contains("defaultTool") && j["defaultTool"].is_string()) {
      state.defaultTool = j["defaultTool"].get<string>();
    }
    if (j.contains("activeSessions") && j["activeSessions"].is_array()) {
      for (const auto& it : j["activeSessions"]) {
        if (it.is_string()) {
          state.sessionTools.insert(it.get<string>());
        }
      }
    }
  } catch (const json::exception& ex) {
    LOG(WARNING) << "Ignoring unreadable session file " << path << ": "
                 << ex.what();
    return SessionState();
  }
  return state;
}

bool SessionStore::save(const SessionState& state) const {
  json j;
  j["defaultTool"] = state.defaultTool;
  j["activeSessions"] = json::array();
  for (const auto& it : state.sessionTools) {
    j["activeSessions"].push_back(it);
  }

  std::error_code ec;
  fs::path parent = fs::path(path).parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent, ec);
    if (ec) {
      LOG(ERROR) << "Cannot create " << parent << ": " << ec.message();
      return false;
    }
  }
  std::ofstream out(path, std::ios::trunc);
  if (!out.good()) {
    LOG(ERROR) << "Cannot write session file " << path << ": "
               << strerror(GetErrno());
    return false;
  }
  out << j.dump(2) << endl;
  VLOG(1) << "Saved session state to " << path;
  return out.good();
}
}  // namespace aic
