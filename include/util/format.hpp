#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace ovaup {

// "512 B", "1.5 KiB", "32.0 MiB", ...
std::string FormatBytes(std::uint64_t bytes);

// "45s", "3m07s", "2h05m10s"
std::string FormatDuration(std::chrono::seconds d);

} // namespace ovaup
