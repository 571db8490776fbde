#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace ovaup {

// Millisecond wall-clock time; the persisted form is exact at this precision.
using SessionClock = std::chrono::system_clock;
using SessionTime = std::chrono::time_point<SessionClock, std::chrono::milliseconds>;

SessionTime SessionNow();

struct ItemProgress {
    std::string file_name;
    std::uint64_t total_size = 0;
    std::uint64_t uploaded_size = 0;
    std::uint64_t chunks_total = 0;
    std::uint64_t chunks_uploaded = 0;
    SessionTime start_time{};
    SessionTime last_update{};
    bool is_completed = false;
    std::string sha1_hash;

    bool operator==(const ItemProgress&) const = default;
};

struct UploadSession {
    std::string session_id;
    std::string ova_file;
    std::string esxi_host;
    std::string datastore;
    std::string vm_name;
    std::uint64_t total_size = 0;
    std::uint64_t uploaded_size = 0;
    SessionTime start_time{};
    SessionTime last_update{};
    bool is_completed = false;
    std::map<std::string, ItemProgress> files;
    std::uint64_t retry_attempts = 0;

    bool operator==(const UploadSession&) const = default;
};

} // namespace ovaup
