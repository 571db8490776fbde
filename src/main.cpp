#include "cli/commands.hpp"
#include "system/signals.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <string>

namespace {

enum LongOnly {
    kOptNetwork = 1000,
    kOptChunkSize,
    kOptWorkers,
    kOptMaxRetries,
    kOptBaseDelay,
    kOptMaxDelay,
    kOptResume,
    kOptSessionId,
    kOptSessionDir,
    kOptSecure,
    kOptNoVerify,
    kOptLog,
    kOptConfig,
    kOptProgressFile,
};

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s upload <archive.ova> <host> -d <datastore> [options]\n"
        "   %s resume [--session-id ID] [-p password]\n"
        "   %s list-sessions\n"
        "   %s clean-sessions\n"
        "\n"
        "Options:\n"
        "  -d, --datastore        Target datastore\n"
        "  -u, --username         User name (default root)\n"
        "  -p, --password         Password (default $%s, else prompt)\n"
        "  -n, --name             VM name (default: archive name without extension)\n"
        "      --network          Network to attach the VM to\n"
        "      --chunk-size       Bytes per PUT request (default 33554432)\n"
        "      --workers          Parallel uploads per disk, 1..10 (default 3)\n"
        "      --max-retries      Attempts per disk, 0 = unlimited (default 0)\n"
        "      --base-delay-ms    First retry delay (default 2000)\n"
        "      --max-delay-ms     Retry delay ceiling (default 120000)\n"
        "      --resume           Continue the most recent (or --session-id) session\n"
        "      --session-id       Session to resume, or id for a new session\n"
        "      --session-dir      Directory holding session files (default .)\n"
        "      --secure           Verify the host's TLS certificate\n"
        "      --no-verify        Skip manifest checksum verification\n"
        "      --config           JSON configuration file\n"
        "      --log              Append a debug log to this file\n"
        "      --progress-file    Write JSON progress to this file instead of the console\n"
        "  -v, --verbose          Debug output\n"
        "  -q, --quiet            Errors only\n"
        "  -h, --help             Show this help\n",
        argv, argv, argv, argv, ovaup::cli::kPasswordEnv);
}

bool ParseU64(const char *name, const char *arg, std::uint64_t &out) {
    char *end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(arg, &end, 10);
    if (errno != 0 || !end || *end != '\0' || *arg == '-' || *arg == '\0') {
        std::fprintf(stderr, "Invalid --%s: %s\n", name, arg);
        return false;
    }
    out = static_cast<std::uint64_t>(v);
    return true;
}

} // namespace

int main(int argc, char **argv) {
    if (argc < 2) {
        PrintUsage(argv[0]);
        return 2;
    }

    const std::string command = argv[1];
    if (command == "-h" || command == "--help" || command == "help") {
        PrintUsage(argv[0]);
        return 0;
    }

    ovaup::InstallSignalHandlers();

    ovaup::cli::CommandLine cmd;

    static option long_opts[] = {
        {"datastore", required_argument, nullptr, 'd'},
        {"username", required_argument, nullptr, 'u'},
        {"password", required_argument, nullptr, 'p'},
        {"name", required_argument, nullptr, 'n'},
        {"network", required_argument, nullptr, kOptNetwork},
        {"chunk-size", required_argument, nullptr, kOptChunkSize},
        {"workers", required_argument, nullptr, kOptWorkers},
        {"max-retries", required_argument, nullptr, kOptMaxRetries},
        {"base-delay-ms", required_argument, nullptr, kOptBaseDelay},
        {"max-delay-ms", required_argument, nullptr, kOptMaxDelay},
        {"resume", no_argument, nullptr, kOptResume},
        {"session-id", required_argument, nullptr, kOptSessionId},
        {"session-dir", required_argument, nullptr, kOptSessionDir},
        {"secure", no_argument, nullptr, kOptSecure},
        {"no-verify", no_argument, nullptr, kOptNoVerify},
        {"log", required_argument, nullptr, kOptLog},
        {"config", required_argument, nullptr, kOptConfig},
        {"progress-file", required_argument, nullptr, kOptProgressFile},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    // Options follow the command word.
    int sub_argc = argc - 1;
    char **sub_argv = argv + 1;

    int idx = 0;
    int c;
    while ((c = getopt_long(sub_argc, sub_argv, "hd:u:p:n:vq", long_opts, &idx)) != -1) {
        std::uint64_t v = 0;
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;
            case 'd': cmd.datastore = optarg; break;
            case 'u': cmd.username = optarg; break;
            case 'p': cmd.password = optarg; break;
            case 'n': cmd.vm_name = optarg; break;
            case 'v': cmd.log_level = ovaup::LogLevel::Debug; break;
            case 'q': cmd.log_level = ovaup::LogLevel::Error; break;
            case kOptNetwork: cmd.network = optarg; break;
            case kOptResume: cmd.resume = true; break;
            case kOptSessionId: cmd.session_id = optarg; break;
            case kOptSessionDir: cmd.session_dir = optarg; break;
            case kOptSecure: cmd.secure = true; break;
            case kOptNoVerify: cmd.no_verify = true; break;
            case kOptLog: cmd.log_path = optarg; break;
            case kOptConfig: cmd.config_path = optarg; break;
            case kOptProgressFile: cmd.progress_file = optarg; break;

            case kOptChunkSize:
                if (!ParseU64("chunk-size", optarg, v)) return 2;
                cmd.chunk_size = v;
                break;
            case kOptWorkers:
                if (!ParseU64("workers", optarg, v)) return 2;
                cmd.workers = v;
                break;
            case kOptMaxRetries:
                if (!ParseU64("max-retries", optarg, v)) return 2;
                cmd.max_retries = v;
                break;
            case kOptBaseDelay:
                if (!ParseU64("base-delay-ms", optarg, v)) return 2;
                cmd.base_delay_ms = v;
                break;
            case kOptMaxDelay:
                if (!ParseU64("max-delay-ms", optarg, v)) return 2;
                cmd.max_delay_ms = v;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    const int positional = sub_argc - optind;

    if (command == "upload") {
        if (positional != 2) {
            PrintUsage(argv[0]);
            return 2;
        }
        cmd.archive = sub_argv[optind];
        cmd.host = sub_argv[optind + 1];
        return ovaup::cli::RunUpload(cmd);
    }

    if (positional != 0) {
        PrintUsage(argv[0]);
        return 2;
    }
    if (command == "resume") {
        return ovaup::cli::RunResume(cmd);
    }
    if (command == "list-sessions") {
        return ovaup::cli::RunListSessions(cmd);
    }
    if (command == "clean-sessions") {
        return ovaup::cli::RunCleanSessions(cmd);
    }

    std::fprintf(stderr, "Unknown command: %s\n", command.c_str());
    PrintUsage(argv[0]);
    return 2;
}
