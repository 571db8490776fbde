#include "io/file_reader.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <limits>
#include <unistd.h>

namespace ovaup {

Result FileReader::Open(std::string path, FileReader& out) {
    out.path_ = std::move(path);

    auto r = Fd::OpenReadOnly(out.path_, out.fd_);
    if (!r.ok) {
        return Result::FailErrno(r.err, "Failed to open input: " + r.msg);
    }

    std::uint64_t size = 0;
    if (out.fd_.Size(size).ok) {
        out.size_ = size;
    } else {
        out.size_ = std::nullopt;
    }

    return Result::Ok();
}

std::optional<std::uint64_t> FileReader::TotalSize() const { return size_; }

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

std::int64_t FileReader::Skip(std::uint64_t n) {
    if (n == 0 || n > static_cast<std::uint64_t>(std::numeric_limits<off_t>::max())) return 0;

    const off_t cur = ::lseek(fd_.Get(), 0, SEEK_CUR);
    if (cur < 0) return 0;

    // Never skip past the end; libarchive treats a short skip as truncation
    // and reads the remainder itself.
    std::uint64_t step = n;
    if (size_) {
        const auto pos = static_cast<std::uint64_t>(cur);
        if (pos >= *size_) return 0;
        step = std::min<std::uint64_t>(step, *size_ - pos);
    }

    if (::lseek(fd_.Get(), static_cast<off_t>(step), SEEK_CUR) < 0) return 0;
    return static_cast<std::int64_t>(step);
}

} // namespace ovaup
