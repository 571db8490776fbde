#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace ovaup {

// Owning wrapper around a POSIX file descriptor.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    static Result OpenReadOnly(const std::string& path, Fd& out);

    int Get() const;
    bool Valid() const;

    // Size of the underlying regular file.
    Result Size(std::uint64_t& out) const;

    void Reset(int fd);
    void Close();

  private:
    int fd_{-1};
};

} // namespace ovaup
