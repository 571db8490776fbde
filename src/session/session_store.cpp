#include "session/session_store.hpp"

#include "session/session_json.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace ovaup {

namespace fs = std::filesystem;

namespace {
constexpr std::string_view kPrefix = ".upload-session-";
constexpr std::string_view kSuffix = ".json";
} // namespace

std::string SessionFileName(const std::string& session_id) {
    return std::string(kPrefix) + session_id + std::string(kSuffix);
}

std::string SessionFilePath(const std::string& dir, const std::string& session_id) {
    const fs::path base = dir.empty() ? fs::path(".") : fs::path(dir);
    return (base / SessionFileName(session_id)).string();
}

std::string SessionIdFromPath(const std::string& path) {
    const std::string name = fs::path(path).filename().string();
    if (name.size() <= kPrefix.size() + kSuffix.size()) return {};
    if (name.compare(0, kPrefix.size(), kPrefix) != 0) return {};
    if (name.compare(name.size() - kSuffix.size(), kSuffix.size(), kSuffix) != 0) return {};
    return name.substr(kPrefix.size(), name.size() - kPrefix.size() - kSuffix.size());
}

std::string NewSessionId(const std::string& dir) {
    auto id = static_cast<long long>(std::time(nullptr));
    std::error_code ec;
    while (fs::exists(SessionFilePath(dir, std::to_string(id)), ec)) {
        ++id;
    }
    return std::to_string(id);
}

Result FindSessionFiles(const std::string& dir, std::vector<std::string>& out) {
    out.clear();
    const fs::path base = dir.empty() ? fs::path(".") : fs::path(dir);

    std::error_code ec;
    fs::directory_iterator it(base, ec);
    if (ec) {
        return Result::Fail(ErrorCode::Io,
                            "failed to search for session files in " + base.string() + ": " +
                                ec.message());
    }

    for (const auto& de : it) {
        std::error_code fec;
        if (!de.is_regular_file(fec)) continue;
        if (SessionIdFromPath(de.path().string()).empty()) continue;
        out.push_back(de.path().string());
    }
    std::sort(out.begin(), out.end());
    return Result::Ok();
}

Result FindMostRecentSession(const std::string& dir, std::string& out_path) {
    std::vector<std::string> files;
    auto r = FindSessionFiles(dir, files);
    if (!r.ok) return r;
    if (files.empty()) return Result::Fail(ErrorCode::NotFound, "no upload sessions found");

    fs::file_time_type best_time{};
    bool have = false;
    for (const auto& f : files) {
        std::error_code ec;
        const auto t = fs::last_write_time(f, ec);
        if (ec) continue;
        if (!have || t > best_time) {
            best_time = t;
            out_path = f;
            have = true;
        }
    }
    if (!have) return Result::Fail(ErrorCode::NotFound, "no readable upload sessions found");
    return Result::Ok();
}

Result FindSessionById(const std::string& dir, const std::string& session_id, std::string& out_path) {
    std::vector<std::string> files;
    auto r = FindSessionFiles(dir, files);
    if (!r.ok) return r;

    for (const auto& f : files) {
        if (SessionIdFromPath(f) == session_id) {
            out_path = f;
            return Result::Ok();
        }
    }
    return Result::Fail(ErrorCode::NotFound, "session with ID " + session_id + " not found");
}

Result LoadSessionFile(const std::string& path, UploadSession& out) {
    std::ifstream is(path, std::ios::binary);
    if (!is.good()) {
        return Result::Fail(ErrorCode::Io, "failed to read session file: " + path);
    }
    std::ostringstream ss;
    ss << is.rdbuf();

    auto parsed = DeserializeSession(ss.str());
    if (!parsed) {
        return Result::Fail(ErrorCode::Parse,
                            "failed to parse session file " + path + ": " + parsed.error());
    }
    out = std::move(*parsed);
    return Result::Ok();
}

Result WriteSessionFile(const std::string& path, const UploadSession& session) {
    const std::string tmp_path = path + ".tmp";
    {
        std::ofstream os(tmp_path, std::ios::trunc | std::ios::binary);
        if (!os.good()) {
            return Result::Fail(ErrorCode::Io, "failed to write session file: " + tmp_path);
        }
        os << SerializeSession(session);
        os.close();
        if (!os.good()) {
            std::remove(tmp_path.c_str());
            return Result::Fail(ErrorCode::Io, "failed to write session file: " + tmp_path);
        }
    }

    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        const int e = errno;
        std::remove(tmp_path.c_str());
        return Result::FailErrno(e, "failed to rename " + tmp_path + " to " + path + " (" +
                                        std::strerror(e) + ")");
    }
    return Result::Ok();
}

} // namespace ovaup
