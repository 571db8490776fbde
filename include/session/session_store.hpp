#pragma once

#include "session/session_types.hpp"
#include "util/result.hpp"

#include <string>
#include <vector>

namespace ovaup {

// Session files live in one directory and are named
// ".upload-session-<id>.json".
std::string SessionFileName(const std::string& session_id);
std::string SessionFilePath(const std::string& dir, const std::string& session_id);

// Extracts <id> from a session file path; empty if the name does not match.
std::string SessionIdFromPath(const std::string& path);

// New unique id: seconds since the epoch, bumped past any existing file.
std::string NewSessionId(const std::string& dir);

// All session files in `dir`, sorted by path.
Result FindSessionFiles(const std::string& dir, std::vector<std::string>& out);

// Most recently modified session file. NotFound if there is none.
Result FindMostRecentSession(const std::string& dir, std::string& out_path);

// Session file whose embedded id equals `session_id`. NotFound otherwise.
Result FindSessionById(const std::string& dir, const std::string& session_id, std::string& out_path);

Result LoadSessionFile(const std::string& path, UploadSession& out);

// Write to "<path>.tmp" then rename over `path`.
Result WriteSessionFile(const std::string& path, const UploadSession& session);

} // namespace ovaup
