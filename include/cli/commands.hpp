#pragma once

#include "cli/uploader_settings.hpp"
#include "util/logger.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace ovaup::cli {

constexpr const char* kPasswordEnv = "OVA_UPLOADER_PASSWORD";

// Parsed command line shared by all sub-commands. Optional fields override
// the config file only when given.
struct CommandLine {
    std::string archive;
    std::string host;
    std::string vm_name;
    std::string session_id;
    std::string config_path;
    std::string log_path;
    std::string progress_file;
    bool resume = false;
    bool secure = false;
    bool no_verify = false;
    LogLevel log_level = LogLevel::Info;

    std::optional<std::string> username;
    std::optional<std::string> password;
    std::optional<std::string> datastore;
    std::optional<std::string> network;
    std::optional<std::string> session_dir;
    std::optional<std::uint64_t> chunk_size;
    std::optional<std::uint64_t> workers;
    std::optional<std::uint64_t> max_retries;
    std::optional<std::uint64_t> base_delay_ms;
    std::optional<std::uint64_t> max_delay_ms;
};

// Archive base name without its extension.
std::string DefaultVmName(const std::string& archive_path);

// Defaults, then the config file, then command-line overrides. Does not
// resolve the password.
Result ResolveSettings(const CommandLine& cmd, UploaderSettings& out);

// Command line, then $OVA_UPLOADER_PASSWORD, then a prompt on the terminal.
Result ResolvePassword(const CommandLine& cmd, const std::string& username, std::string& out);

int RunUpload(const CommandLine& cmd);
int RunResume(const CommandLine& cmd);
int RunListSessions(const CommandLine& cmd);
int RunCleanSessions(const CommandLine& cmd);

} // namespace ovaup::cli
