#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ovaup::config {

// Values present in a JSON configuration file. Absent keys stay empty so
// the command line and the built-in defaults can fill them.
class UploaderConfigFromFile {
public:
    std::optional<std::string> username;
    std::optional<std::string> datastore;
    std::optional<std::string> network;
    std::optional<bool> insecure;

    std::optional<std::uint64_t> chunk_size;
    std::optional<std::uint64_t> workers;

    std::optional<std::uint64_t> max_retries;
    std::optional<std::uint64_t> base_delay_ms;
    std::optional<std::uint64_t> max_delay_ms;
    std::optional<double> backoff_factor;
    std::optional<double> jitter_fraction;
    std::optional<std::vector<std::string>> retryable_errors;

    std::optional<std::string> session_dir;
    std::optional<std::uint64_t> save_interval_ms;
    std::optional<bool> verify_checksums;

    Result LoadFile(const std::string &path);

    void Reset();
};

} // namespace ovaup::config
