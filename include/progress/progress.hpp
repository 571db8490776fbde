#pragma once
#include <chrono>
#include <cstdint>
#include <string_view>

namespace ovaup {

struct ProgressEvent {
    std::string_view item;
    std::uint64_t item_done = 0;
    std::uint64_t item_total = 0;

    std::uint64_t overall_done = 0;
    std::uint64_t overall_total = 0;

    double bytes_per_second = 0.0;
    std::chrono::seconds eta{0};
};

class IProgress {
  public:
    virtual ~IProgress() = default;
    virtual void OnProgress(const ProgressEvent& e) = 0;
};

} // namespace ovaup
