#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace ovaup {

// Reads exactly the bytes [offset, offset + length) of a file with pread(),
// so the file position is never shared.
class FileRangeReader final : public IReader {
public:
    static Result Open(const std::string& path,
                       std::uint64_t offset,
                       std::uint64_t length,
                       FileRangeReader& out);

    ssize_t Read(std::span<std::uint8_t> out) override;
    std::optional<std::uint64_t> TotalSize() const override { return length_; }

    std::uint64_t Remaining() const { return length_ - consumed_; }

private:
    Fd fd_;
    std::uint64_t offset_ = 0;
    std::uint64_t length_ = 0;
    std::uint64_t consumed_ = 0;
};

// Opens an independent reader over a (path, offset, length) triple.
class IRangeSource {
public:
    virtual ~IRangeSource() = default;

    virtual Result OpenRange(const std::string& path,
                             std::uint64_t offset,
                             std::uint64_t length,
                             std::unique_ptr<IReader>& out) const = 0;
};

class FileRangeSource final : public IRangeSource {
public:
    Result OpenRange(const std::string& path,
                     std::uint64_t offset,
                     std::uint64_t length,
                     std::unique_ptr<IReader>& out) const override;
};

// Reads a whole range into memory. Intended for small entries (manifest,
// descriptor); fails with Io if the range is truncated.
Result ReadRangeToString(const IRangeSource& source,
                         const std::string& path,
                         std::uint64_t offset,
                         std::uint64_t length,
                         std::string& out);

} // namespace ovaup
