#include "util/format.hpp"

#include <cstdio>

namespace ovaup {

std::string FormatBytes(std::uint64_t bytes) {
    constexpr std::uint64_t kUnit = 1024;
    if (bytes < kUnit) {
        return std::to_string(bytes) + " B";
    }

    std::uint64_t div = kUnit;
    int exp = 0;
    for (std::uint64_t n = bytes / kUnit; n >= kUnit && exp < 5; n /= kUnit) {
        div *= kUnit;
        ++exp;
    }

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f %ciB",
                  static_cast<double>(bytes) / static_cast<double>(div), "KMGTPE"[exp]);
    return buf;
}

std::string FormatDuration(std::chrono::seconds d) {
    long long s = d.count();
    if (s < 0) s = 0;
    const long long h = s / 3600;
    const long long m = (s % 3600) / 60;
    const long long sec = s % 60;

    char buf[48];
    if (h > 0) {
        std::snprintf(buf, sizeof(buf), "%lldh%02lldm%02llds", h, m, sec);
    } else if (m > 0) {
        std::snprintf(buf, sizeof(buf), "%lldm%02llds", m, sec);
    } else {
        std::snprintf(buf, sizeof(buf), "%llds", sec);
    }
    return buf;
}

} // namespace ovaup
