#pragma once

#include "io/io.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace ovaup {

class MemoryReader final : public IReader {
  public:
    explicit MemoryReader(const std::string& data) : data_(data.begin(), data.end()) {}

    explicit MemoryReader(std::vector<std::uint8_t> data) : data_(std::move(data)) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (pos_ >= data_.size())
            return 0;
        const size_t n = std::min(out.size(), data_.size() - pos_);
        std::copy(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                  data_.begin() + static_cast<std::ptrdiff_t>(pos_ + n),
                  out.begin());
        pos_ += n;
        return static_cast<ssize_t>(n);
    }

    std::optional<std::uint64_t> TotalSize() const override {
        return static_cast<std::uint64_t>(data_.size());
    }

    std::int64_t Skip(std::uint64_t n) override {
        const std::uint64_t left = data_.size() - pos_;
        const std::uint64_t k = std::min(n, left);
        pos_ += static_cast<size_t>(k);
        return static_cast<std::int64_t>(k);
    }

  private:
    std::vector<std::uint8_t> data_;
    size_t pos_ = 0;
};

} // namespace ovaup
