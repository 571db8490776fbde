#include "util/config_json_utils.hpp"

#include <fstream>

namespace ovaup::config::detail {

namespace {

// Each getter leaves `out` untouched when the key is absent and fails when
// the key is present with the wrong type.
bool GetStringIfPresent(const nlohmann::json& j, const char* key,
                        std::optional<std::string>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key,
                     std::optional<std::uint64_t>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!(it->is_number_unsigned() || it->is_number_integer())) {
        err = std::string(key) + " must be an integer";
        return false;
    }
    auto v = it->get<long long>();
    if (v < 0) {
        err = std::string(key) + " must not be negative";
        return false;
    }
    out = static_cast<std::uint64_t>(v);
    return true;
}

bool GetDoubleIfPresent(const nlohmann::json& j, const char* key,
                        std::optional<double>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_number()) {
        err = std::string(key) + " must be a number";
        return false;
    }
    out = it->get<double>();
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key,
                      std::optional<bool>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_boolean()) {
        err = std::string(key) + " must be true or false";
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool GetStringListIfPresent(const nlohmann::json& j, const char* key,
                            std::optional<std::vector<std::string>>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_array()) {
        err = std::string(key) + " must be an array of strings";
        return false;
    }
    std::vector<std::string> v;
    for (const auto& e : *it) {
        if (!e.is_string()) {
            err = std::string(key) + " must be an array of strings";
            return false;
        }
        v.push_back(e.get<std::string>());
    }
    out = std::move(v);
    return true;
}

} // namespace

Result LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out) {
    std::ifstream is(path);
    if (!is.good()) {
        return Result::Fail(ErrorCode::Io, "config: cannot open " + path);
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        return Result::Fail(ErrorCode::Parse, "config: invalid JSON in " + path + ": " + e.what());
    }

    if (!out.is_object()) {
        return Result::Fail(ErrorCode::Parse, "config: root must be JSON object: " + path);
    }

    return Result::Ok();
}

bool FillConfigFromJson(const nlohmann::json& j, UploaderConfigFromFile& cfg, std::string& err) {
    return GetStringIfPresent(j, "Username", cfg.username, err) &&
           GetStringIfPresent(j, "Datastore", cfg.datastore, err) &&
           GetStringIfPresent(j, "Network", cfg.network, err) &&
           GetBoolIfPresent(j, "Insecure", cfg.insecure, err) &&
           GetU64IfPresent(j, "ChunkSize", cfg.chunk_size, err) &&
           GetU64IfPresent(j, "Workers", cfg.workers, err) &&
           GetU64IfPresent(j, "MaxRetries", cfg.max_retries, err) &&
           GetU64IfPresent(j, "BaseDelayMs", cfg.base_delay_ms, err) &&
           GetU64IfPresent(j, "MaxDelayMs", cfg.max_delay_ms, err) &&
           GetDoubleIfPresent(j, "BackoffFactor", cfg.backoff_factor, err) &&
           GetDoubleIfPresent(j, "JitterFraction", cfg.jitter_fraction, err) &&
           GetStringListIfPresent(j, "RetryableErrors", cfg.retryable_errors, err) &&
           GetStringIfPresent(j, "SessionDir", cfg.session_dir, err) &&
           GetU64IfPresent(j, "SaveIntervalMs", cfg.save_interval_ms, err) &&
           GetBoolIfPresent(j, "VerifyChecksums", cfg.verify_checksums, err);
}

} // namespace ovaup::config::detail
