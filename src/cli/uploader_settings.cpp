#include "cli/uploader_settings.hpp"

#include <limits>

namespace ovaup {

void UploaderSettings::ApplyFile(const config::UploaderConfigFromFile& file) {
    if (file.username) username = *file.username;
    if (file.datastore) datastore = *file.datastore;
    if (file.network) network = *file.network;
    if (file.insecure) insecure = *file.insecure;
    if (file.chunk_size) chunk_size = *file.chunk_size;
    if (file.workers) {
        workers = *file.workers > static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                      ? std::numeric_limits<int>::max()
                      : static_cast<int>(*file.workers);
    }
    if (file.max_retries) {
        retry.max_attempts =
            *file.max_retries > static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                ? std::numeric_limits<int>::max()
                : static_cast<int>(*file.max_retries);
    }
    if (file.base_delay_ms) retry.base_delay = std::chrono::milliseconds(*file.base_delay_ms);
    if (file.max_delay_ms) retry.max_delay = std::chrono::milliseconds(*file.max_delay_ms);
    if (file.backoff_factor) retry.backoff_factor = *file.backoff_factor;
    if (file.jitter_fraction) retry.jitter_fraction = *file.jitter_fraction;
    if (file.retryable_errors) retry.retryable_patterns = *file.retryable_errors;
    if (file.session_dir) session_dir = *file.session_dir;
    if (file.save_interval_ms) save_interval = std::chrono::milliseconds(*file.save_interval_ms);
    if (file.verify_checksums) verify_checksums = *file.verify_checksums;
}

Result UploaderSettings::Validate() const {
    if (datastore.empty()) {
        return Result::Fail(ErrorCode::InvalidArgument, "datastore is required");
    }
    if (chunk_size == 0) {
        return Result::Fail(ErrorCode::InvalidArgument, "chunk size must be positive");
    }
    if (workers < 1 || workers > kMaxWorkers) {
        return Result::Fail(ErrorCode::InvalidArgument,
                            "workers must be between 1 and " + std::to_string(kMaxWorkers));
    }
    if (retry.backoff_factor < 1.0) {
        return Result::Fail(ErrorCode::InvalidArgument, "backoff factor must be at least 1");
    }
    if (retry.jitter_fraction < 0.0 || retry.jitter_fraction > 1.0) {
        return Result::Fail(ErrorCode::InvalidArgument, "jitter fraction must be within [0, 1]");
    }
    if (retry.max_delay < retry.base_delay) {
        return Result::Fail(ErrorCode::InvalidArgument, "max delay is below the base delay");
    }
    return Result::Ok();
}

UploadOptions UploaderSettings::ToUploadOptions() const {
    UploadOptions o;
    o.chunk_size = chunk_size;
    o.workers = workers;
    o.username = username;
    o.password = password;
    o.insecure = insecure;
    return o;
}

TrackerOptions UploaderSettings::ToTrackerOptions() const {
    TrackerOptions o;
    o.session_dir = session_dir;
    o.save_interval = save_interval;
    o.chunk_size = chunk_size;
    return o;
}

} // namespace ovaup
