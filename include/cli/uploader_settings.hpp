#pragma once

#include "session/session_tracker.hpp"
#include "transfer/chunked_uploader.hpp"
#include "transfer/retry_executor.hpp"
#include "util/config_parser.hpp"
#include "util/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace ovaup {

// Effective settings of one run: built-in defaults, then the config file,
// then command-line flags.
struct UploaderSettings {
    std::string username = "root";
    std::string password;
    std::string datastore;
    std::string network;
    bool insecure = true;

    std::uint64_t chunk_size = kDefaultChunkSize;
    int workers = kDefaultWorkers;

    RetryPolicy retry = RetryPolicy::Network();

    std::string session_dir = ".";
    std::chrono::milliseconds save_interval{5000};
    bool verify_checksums = true;

    void ApplyFile(const config::UploaderConfigFromFile& file);
    Result Validate() const;

    UploadOptions ToUploadOptions() const;
    TrackerOptions ToTrackerOptions() const;
};

} // namespace ovaup
