#pragma once

#include <cmath>
#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace pfs::util {

// SI representation: 9B, 1.5kB, 12MB
inline std::string humanizeBytes(const uint64_t s) {
    if (s < 10) return fmt::format("{}B", s);

    static const char* kUnits[] = {"B", "kB", "MB", "GB", "TB", "PB", "EB"};
    constexpr double base = 1000.0;

    const auto e = static_cast<int>(std::floor(std::log(static_cast<double>(s)) / std::log(base)));
    const double val = std::floor(static_cast<double>(s) / std::pow(base, e) * 10 + 0.5) / 10;

    if (val < 10) return fmt::format("{:.1f}{}", val, kUnits[e]);
    return fmt::format("{:.0f}{}", val, kUnits[e]);
}

} // namespace pfs::util
