#pragma once

#include <sys/types.h>

#include <cstdint>
#include <optional>
#include <span>

namespace ovaup {

class IReader {
public:
    virtual ~IReader() = default;

    // Returns bytes read, 0 at end of stream, -1 on error (errno set).
    virtual ssize_t Read(std::span<std::uint8_t> out) = 0;

    virtual std::optional<std::uint64_t> TotalSize() const { return std::nullopt; }

    // Advances the stream by up to `n` bytes without reading them.
    // Returns the number of bytes skipped; 0 means the reader cannot skip
    // and the caller must fall back to Read().
    virtual std::int64_t Skip(std::uint64_t n) {
        (void)n;
        return 0;
    }
};

} // namespace ovaup
