#include "session/session_json.hpp"

#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace ovaup {

using json = nlohmann::json;

namespace {

SessionTime TimeField(const json& j, const char* key) {
    const std::string s = j.at(key).get<std::string>();
    auto t = ParseSessionTime(s);
    if (!t) throw std::invalid_argument(std::string("invalid time in '") + key + "': " + s);
    return *t;
}

} // namespace

SessionTime SessionNow() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(SessionClock::now());
}

std::string FormatSessionTime(SessionTime t) {
    const auto ms = t.time_since_epoch().count();
    long long secs = ms / 1000;
    long long frac = ms % 1000;
    if (frac < 0) {
        frac += 1000;
        secs -= 1;
    }

    const std::time_t tt = static_cast<std::time_t>(secs);
    std::tm tm{};
    gmtime_r(&tt, &tm);

    char buf[40];
    const size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    std::snprintf(buf + n, sizeof(buf) - n, ".%03lldZ", frac);
    return buf;
}

std::optional<SessionTime> ParseSessionTime(const std::string& s) {
    int year = 0, mon = 0, day = 0, hour = 0, min = 0, sec = 0;
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &mon, &day, &hour, &min, &sec, &consumed) != 6) {
        return std::nullopt;
    }

    size_t pos = static_cast<size_t>(consumed);
    long long millis = 0;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
            if (digits < 3) millis = millis * 10 + (s[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (; digits < 3; ++digits) millis *= 10;
    }

    long long offset_secs = 0;
    if (pos < s.size() && (s[pos] == 'Z' || s[pos] == 'z')) {
        ++pos;
    } else if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) {
        const int sign = s[pos] == '-' ? -1 : 1;
        int oh = 0, om = 0;
        if (std::sscanf(s.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2) return std::nullopt;
        offset_secs = sign * (oh * 3600LL + om * 60LL);
        pos += 6;
    } else {
        return std::nullopt;
    }
    if (pos != s.size()) return std::nullopt;

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = mon - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    const std::time_t utc = timegm(&tm);

    const long long total_ms = (static_cast<long long>(utc) - offset_secs) * 1000LL + millis;
    return SessionTime(std::chrono::milliseconds(total_ms));
}

void to_json(json& j, const ItemProgress& p) {
    j = json{
        {"fileName", p.file_name},
        {"totalSize", p.total_size},
        {"uploadedSize", p.uploaded_size},
        {"chunksTotal", p.chunks_total},
        {"chunksUploaded", p.chunks_uploaded},
        {"startTime", FormatSessionTime(p.start_time)},
        {"lastUpdate", FormatSessionTime(p.last_update)},
        {"isCompleted", p.is_completed},
    };
    if (!p.sha1_hash.empty()) j["sha1Hash"] = p.sha1_hash;
}

void from_json(const json& j, ItemProgress& p) {
    j.at("fileName").get_to(p.file_name);
    j.at("totalSize").get_to(p.total_size);
    j.at("uploadedSize").get_to(p.uploaded_size);
    p.chunks_total = j.value("chunksTotal", 0ULL);
    p.chunks_uploaded = j.value("chunksUploaded", 0ULL);
    p.start_time = TimeField(j, "startTime");
    p.last_update = TimeField(j, "lastUpdate");
    j.at("isCompleted").get_to(p.is_completed);
    p.sha1_hash = j.value("sha1Hash", "");
}

void to_json(json& j, const UploadSession& s) {
    j = json{
        {"sessionId", s.session_id},
        {"ovaFile", s.ova_file},
        {"esxiHost", s.esxi_host},
        {"datastore", s.datastore},
        {"vmName", s.vm_name},
        {"totalSize", s.total_size},
        {"uploadedSize", s.uploaded_size},
        {"startTime", FormatSessionTime(s.start_time)},
        {"lastUpdate", FormatSessionTime(s.last_update)},
        {"isCompleted", s.is_completed},
        {"files", s.files},
        {"retryAttempts", s.retry_attempts},
    };
}

void from_json(const json& j, UploadSession& s) {
    j.at("sessionId").get_to(s.session_id);
    j.at("ovaFile").get_to(s.ova_file);
    s.esxi_host = j.value("esxiHost", "");
    s.datastore = j.value("datastore", "");
    s.vm_name = j.value("vmName", "");
    j.at("totalSize").get_to(s.total_size);
    j.at("uploadedSize").get_to(s.uploaded_size);
    s.start_time = TimeField(j, "startTime");
    s.last_update = TimeField(j, "lastUpdate");
    j.at("isCompleted").get_to(s.is_completed);
    s.files.clear();
    if (auto it = j.find("files"); it != j.end() && !it->is_null()) {
        it->get_to(s.files);
    }
    s.retry_attempts = j.value("retryAttempts", 0ULL);
}

std::string SerializeSession(const UploadSession& s) {
    return json(s).dump(2);
}

std::expected<UploadSession, std::string> DeserializeSession(const std::string& text) {
    try {
        if (text.find_first_not_of(" \t\n\r") == std::string::npos) {
            return std::unexpected("Empty input");
        }

        auto j = json::parse(text);
        if (!j.is_object()) {
            return std::unexpected("JSON root must be an object");
        }
        return j.get<UploadSession>();
    } catch (const json::parse_error& e) {
        return std::unexpected(std::string("Syntax Error: ") + e.what());
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Invalid session: ") + e.what());
    }
}

} // namespace ovaup
