#include "cli/commands.hpp"

#include "io/range_reader.hpp"
#include "net/curl_http_client.hpp"
#include "ova/archive_indexer.hpp"
#include "progress/progress_sinks.hpp"
#include "remote/esxi_datastore_client.hpp"
#include "session/session_json.hpp"
#include "session/session_store.hpp"
#include "session/session_tracker.hpp"
#include "system/cancel_token.hpp"
#include "system/signals.hpp"
#include "transfer/transfer_coordinator.hpp"
#include "util/format.hpp"

#include <termios.h>
#include <unistd.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <limits>
#include <memory>
#include <vector>

namespace ovaup::cli {

namespace fs = std::filesystem;

namespace {

Result SetupLogging(const CommandLine& cmd) {
    Logger::Instance().SetLevel(cmd.log_level);
    if (!cmd.log_path.empty()) {
        return Logger::Instance().SetLogFile(cmd.log_path);
    }
    return Result::Ok();
}

int ClampToInt(std::uint64_t v) {
    return v > static_cast<std::uint64_t>(std::numeric_limits<int>::max())
               ? std::numeric_limits<int>::max()
               : static_cast<int>(v);
}

std::string PromptPassword(const std::string& user, const std::string& host) {
    std::fprintf(stderr, "Password for %s@%s: ", user.c_str(), host.c_str());
    std::fflush(stderr);

    termios old_tio{};
    const bool tty = ::isatty(STDIN_FILENO) && ::tcgetattr(STDIN_FILENO, &old_tio) == 0;
    if (tty) {
        termios no_echo = old_tio;
        no_echo.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &no_echo);
    }

    std::string line;
    std::getline(std::cin, line);

    if (tty) {
        ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &old_tio);
    }
    std::fprintf(stderr, "\n");
    return line;
}

// Loads the session to resume, or returns nullptr when a new one is needed.
std::unique_ptr<SessionTracker> LoadResumeSession(const CommandLine& cmd,
                                                  const UploaderSettings& settings,
                                                  const std::string& archive_path) {
    std::string path;
    Result r = cmd.session_id.empty()
                   ? FindMostRecentSession(settings.session_dir, path)
                   : FindSessionById(settings.session_dir, cmd.session_id, path);
    if (!r.ok) {
        LogWarn("Cannot resume: %s. Starting a new upload", r.msg.c_str());
        return nullptr;
    }

    UploadSession stored;
    r = LoadSessionFile(path, stored);
    if (!r.ok) {
        LogWarn("%s. Starting a new upload", r.msg.c_str());
        return nullptr;
    }
    if (stored.ova_file != archive_path) {
        LogWarn("Session %s belongs to %s, not %s. Starting a new upload",
                stored.session_id.c_str(), stored.ova_file.c_str(), archive_path.c_str());
        return nullptr;
    }

    std::unique_ptr<SessionTracker> tracker;
    r = SessionTracker::Load(path, settings.ToTrackerOptions(), tracker);
    if (!r.ok) {
        LogWarn("Failed to load session %s: %s. Starting a new upload", path.c_str(),
                r.msg.c_str());
        return nullptr;
    }

    const UploadSession s = tracker->SnapshotSession();
    LogInfo("Resuming upload session %s (%s of %s done)", s.session_id.c_str(),
            FormatBytes(s.uploaded_size).c_str(), FormatBytes(s.total_size).c_str());
    return tracker;
}

// Session directory from --session-dir, else the config file, else ".".
Result ResolveSessionDir(const CommandLine& cmd, std::string& out) {
    out = UploaderSettings{}.session_dir;
    if (cmd.session_dir) {
        out = *cmd.session_dir;
        return Result::Ok();
    }
    if (!cmd.config_path.empty()) {
        config::UploaderConfigFromFile file;
        auto r = file.LoadFile(cmd.config_path);
        if (!r.ok) return r;
        if (file.session_dir) out = *file.session_dir;
    }
    return Result::Ok();
}

} // namespace

std::string DefaultVmName(const std::string& archive_path) {
    return fs::path(archive_path).stem().string();
}

Result ResolveSettings(const CommandLine& cmd, UploaderSettings& out) {
    out = UploaderSettings{};

    if (!cmd.config_path.empty()) {
        config::UploaderConfigFromFile file;
        auto r = file.LoadFile(cmd.config_path);
        if (!r.ok) return r;
        out.ApplyFile(file);
    }

    if (cmd.username) out.username = *cmd.username;
    if (cmd.datastore) out.datastore = *cmd.datastore;
    if (cmd.network) out.network = *cmd.network;
    if (cmd.session_dir) out.session_dir = *cmd.session_dir;
    if (cmd.secure) out.insecure = false;
    if (cmd.no_verify) out.verify_checksums = false;
    if (cmd.chunk_size) out.chunk_size = *cmd.chunk_size;
    if (cmd.workers) out.workers = ClampToInt(*cmd.workers);
    if (cmd.max_retries) out.retry.max_attempts = ClampToInt(*cmd.max_retries);
    if (cmd.base_delay_ms) out.retry.base_delay = std::chrono::milliseconds(*cmd.base_delay_ms);
    if (cmd.max_delay_ms) out.retry.max_delay = std::chrono::milliseconds(*cmd.max_delay_ms);

    return out.Validate();
}

Result ResolvePassword(const CommandLine& cmd, const std::string& username, std::string& out) {
    if (cmd.password) {
        out = *cmd.password;
        return Result::Ok();
    }
    if (const char* env = std::getenv(kPasswordEnv); env != nullptr) {
        out = env;
        return Result::Ok();
    }
    if (!::isatty(STDIN_FILENO)) {
        return Result::Fail(ErrorCode::InvalidArgument,
                            std::string("no password given (use -p or ") + kPasswordEnv + ")");
    }
    out = PromptPassword(username, cmd.host);
    return Result::Ok();
}

int RunUpload(const CommandLine& cmd) {
    if (auto r = SetupLogging(cmd); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 2;
    }
    if (cmd.archive.empty() || cmd.host.empty()) {
        std::fprintf(stderr, "ERROR: archive and host are required\n");
        return 2;
    }

    UploaderSettings settings;
    if (auto r = ResolveSettings(cmd, settings); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 2;
    }

    std::error_code ec;
    const std::string archive_path = fs::absolute(cmd.archive, ec).string();
    if (ec) {
        std::fprintf(stderr, "ERROR: invalid archive path %s: %s\n", cmd.archive.c_str(),
                     ec.message().c_str());
        return 2;
    }
    const std::string vm_name = cmd.vm_name.empty() ? DefaultVmName(archive_path) : cmd.vm_name;

    if (auto r = ResolvePassword(cmd, settings.username, settings.password); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 2;
    }

    FileRangeSource source;
    ArchiveIndexer indexer(source);
    ArchivePackage pkg;
    if (auto r = indexer.Index(archive_path, pkg); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 1;
    }
    LogInfo("%s: descriptor %s, %zu payload(s), %s to upload", archive_path.c_str(),
            pkg.descriptor.name.c_str(), pkg.payloads.size(),
            FormatBytes(pkg.TotalPayloadSize()).c_str());
    for (const auto& name : pkg.ListEntries()) {
        LogDebug("  %s", name.c_str());
    }

    std::unique_ptr<SessionTracker> tracker;
    if (cmd.resume) {
        tracker = LoadResumeSession(cmd, settings, archive_path);
    }
    if (!tracker) {
        SessionIdentity id;
        id.session_id = cmd.resume ? std::string() : cmd.session_id;
        id.ova_file = archive_path;
        id.esxi_host = cmd.host;
        id.datastore = settings.datastore;
        id.vm_name = vm_name;
        tracker = SessionTracker::Create(id, settings.ToTrackerOptions());
    }
    const std::string session_id = tracker->SnapshotSession().session_id;

    std::unique_ptr<IProgress> progress;
    if (!cmd.progress_file.empty()) {
        progress = std::make_unique<FileProgressSink>(cmd.progress_file);
    } else if (cmd.log_level <= LogLevel::Info) {
        progress = std::make_unique<ConsoleProgressSink>();
    }

    CurlHttpClient http;
    EsxiConfig esxi;
    esxi.host = cmd.host;
    esxi.username = settings.username;
    esxi.password = settings.password;
    esxi.insecure = settings.insecure;
    EsxiDatastoreClient client(esxi, http);

    CoordinatorOptions copt;
    copt.upload = settings.ToUploadOptions();
    copt.retry = settings.retry;
    copt.verify_checksums = settings.verify_checksums;
    copt.datastore = settings.datastore;
    copt.vm_name = vm_name;
    copt.network = settings.network;

    TransferCoordinator coordinator(client, http, source, copt, progress.get());
    CancelToken cancel(&g_cancel);

    const auto started = std::chrono::steady_clock::now();
    auto r = coordinator.Run(pkg, *tracker, cancel);
    ClearProgressLine();

    const UploadSession final_state = tracker->SnapshotSession();
    if (!r.ok) {
        tracker->Close();
        std::fprintf(stderr, "ERROR (%s): %s\n", ErrorCodeName(r.code), r.msg.c_str());
        std::fprintf(stderr, "Progress saved. Resume with: ova-uploader resume --session-id %s\n",
                     session_id.c_str());
        return 1;
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started);
    std::printf("Uploaded %s (%s) to %s [%s] in %s\n", vm_name.c_str(),
                FormatBytes(final_state.total_size).c_str(), cmd.host.c_str(),
                settings.datastore.c_str(), FormatDuration(elapsed).c_str());
    if (final_state.retry_attempts > 0) {
        std::printf("Total retry attempts: %llu\n",
                    (unsigned long long)final_state.retry_attempts);
    }
    return 0;
}

int RunResume(const CommandLine& cmd) {
    if (auto r = SetupLogging(cmd); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 2;
    }

    std::string dir;
    if (auto r = ResolveSessionDir(cmd, dir); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 2;
    }

    std::string path;
    Result r = cmd.session_id.empty() ? FindMostRecentSession(dir, path)
                                      : FindSessionById(dir, cmd.session_id, path);
    if (!r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 1;
    }

    UploadSession s;
    r = LoadSessionFile(path, s);
    if (!r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 1;
    }

    std::printf("Resuming session %s\n", s.session_id.c_str());
    std::printf("  Archive:   %s\n", s.ova_file.c_str());
    std::printf("  Host:      %s\n", s.esxi_host.c_str());
    std::printf("  Datastore: %s\n", s.datastore.c_str());

    CommandLine next = cmd;
    next.archive = s.ova_file;
    next.host = s.esxi_host;
    next.vm_name = s.vm_name;
    next.session_id = s.session_id;
    next.resume = true;
    if (!next.datastore) next.datastore = s.datastore;
    return RunUpload(next);
}

int RunListSessions(const CommandLine& cmd) {
    std::string dir;
    if (auto r = ResolveSessionDir(cmd, dir); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 2;
    }

    std::vector<std::string> files;
    if (auto r = FindSessionFiles(dir, files); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 1;
    }
    if (files.empty()) {
        std::printf("No upload sessions found.\n");
        return 0;
    }

    std::printf("Found %zu upload session(s):\n\n", files.size());
    for (const auto& f : files) {
        UploadSession s;
        if (auto r = LoadSessionFile(f, s); !r.ok) {
            std::printf("[unreadable] %s (%s)\n\n", f.c_str(), r.msg.c_str());
            continue;
        }

        const double pct = s.total_size > 0 ? static_cast<double>(s.uploaded_size) * 100.0 /
                                                  static_cast<double>(s.total_size)
                                            : 0.0;
        std::printf("[%s] Session ID: %s\n", s.is_completed ? "complete" : "incomplete",
                    s.session_id.c_str());
        std::printf("   File: %s\n", fs::path(s.ova_file).filename().c_str());
        std::printf("   ESXi: %s\n", s.esxi_host.c_str());
        std::printf("   Datastore: %s\n", s.datastore.c_str());
        std::printf("   VM Name: %s\n", s.vm_name.c_str());
        std::printf("   Progress: %.1f%% (%s / %s)\n", pct, FormatBytes(s.uploaded_size).c_str(),
                    FormatBytes(s.total_size).c_str());
        std::printf("   Files: %zu total\n", s.files.size());
        std::printf("   Last Update: %s\n", FormatSessionTime(s.last_update).c_str());
        if (s.retry_attempts > 0) {
            std::printf("   Retry Attempts: %llu\n", (unsigned long long)s.retry_attempts);
        }
        std::printf("\n");
    }
    return 0;
}

int RunCleanSessions(const CommandLine& cmd) {
    std::string dir;
    if (auto r = ResolveSessionDir(cmd, dir); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 2;
    }

    std::vector<std::string> files;
    if (auto r = FindSessionFiles(dir, files); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 1;
    }
    if (files.empty()) {
        std::printf("No session files to clean.\n");
        return 0;
    }

    int failed = 0;
    for (const auto& f : files) {
        std::error_code ec;
        if (!fs::remove(f, ec) || ec) {
            std::fprintf(stderr, "Failed to delete %s: %s\n", f.c_str(),
                         ec ? ec.message().c_str() : "not found");
            ++failed;
            continue;
        }
        std::printf("Deleted %s\n", f.c_str());
    }
    std::printf("Deleted %zu session file(s).\n", files.size() - static_cast<size_t>(failed));
    return failed == 0 ? 0 : 1;
}

} // namespace ovaup::cli
