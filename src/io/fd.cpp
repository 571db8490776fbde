#include "io/fd.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ovaup {

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        Close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Fd::~Fd() { Close(); }

Result Fd::OpenReadOnly(const std::string& path, Fd& out) {
    int fd = -1;
    do {
        fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        const int e = errno;
        return Result::FailErrno(e, "failed to open " + path + " (" + std::strerror(e) + ")");
    }
    out.Reset(fd);
    return Result::Ok();
}

int Fd::Get() const { return fd_; }

bool Fd::Valid() const { return fd_ >= 0; }

Result Fd::Size(std::uint64_t& out) const {
    struct stat st{};
    if (::fstat(fd_, &st) != 0) {
        const int e = errno;
        return Result::FailErrno(e, std::string("fstat failed (") + std::strerror(e) + ")");
    }
    out = st.st_size > 0 ? static_cast<std::uint64_t>(st.st_size) : 0;
    return Result::Ok();
}

void Fd::Reset(int fd) {
    Close();
    fd_ = fd;
}

void Fd::Close() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = -1;
}

} // namespace ovaup
