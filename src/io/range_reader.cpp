#include "io/range_reader.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <vector>

namespace ovaup {

Result FileRangeReader::Open(const std::string& path,
                             std::uint64_t offset,
                             std::uint64_t length,
                             FileRangeReader& out) {
    auto r = Fd::OpenReadOnly(path, out.fd_);
    if (!r.ok) return r;

    std::uint64_t size = 0;
    r = out.fd_.Size(size);
    if (!r.ok) return r;

    if (offset > size || length > size - offset) {
        return Result::Fail(ErrorCode::Io,
                            "range [" + std::to_string(offset) + ", +" + std::to_string(length) +
                                ") exceeds file size " + std::to_string(size) + " of " + path);
    }

    out.offset_ = offset;
    out.length_ = length;
    out.consumed_ = 0;
    return Result::Ok();
}

ssize_t FileRangeReader::Read(std::span<std::uint8_t> out) {
    if (consumed_ >= length_ || out.empty()) return 0;

    const auto want = static_cast<size_t>(std::min<std::uint64_t>(out.size(), length_ - consumed_));
    while (true) {
        const ssize_t n = ::pread(fd_.Get(), out.data(), want,
                                  static_cast<off_t>(offset_ + consumed_));
        if (n > 0) {
            consumed_ += static_cast<std::uint64_t>(n);
            return n;
        }
        if (n == 0) {
            // File shrank underneath us.
            errno = EIO;
            return -1;
        }
        if (errno == EINTR) continue;
        return -1;
    }
}

Result FileRangeSource::OpenRange(const std::string& path,
                                  std::uint64_t offset,
                                  std::uint64_t length,
                                  std::unique_ptr<IReader>& out) const {
    auto reader = std::make_unique<FileRangeReader>();
    auto r = FileRangeReader::Open(path, offset, length, *reader);
    if (!r.ok) return r;
    out = std::move(reader);
    return Result::Ok();
}

Result ReadRangeToString(const IRangeSource& source,
                         const std::string& path,
                         std::uint64_t offset,
                         std::uint64_t length,
                         std::string& out) {
    std::unique_ptr<IReader> reader;
    auto r = source.OpenRange(path, offset, length, reader);
    if (!r.ok) return r;

    out.clear();
    out.reserve(static_cast<size_t>(length));

    std::vector<std::uint8_t> buf(64 * 1024);
    while (out.size() < length) {
        const ssize_t n = reader->Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n < 0) {
            const int e = errno;
            return Result::FailErrno(e, "read failed at offset " +
                                            std::to_string(offset + out.size()) + " of " + path +
                                            " (" + std::strerror(e) + ")");
        }
        if (n == 0) break;
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    }

    if (out.size() != length) {
        return Result::Fail(ErrorCode::Io,
                            "short read from " + path + ": got " + std::to_string(out.size()) +
                                " of " + std::to_string(length) + " bytes");
    }
    return Result::Ok();
}

} // namespace ovaup
