#pragma once

#include <string>
#include <fmt/format.h>

namespace sm::util {

// "512 B/s", "1.50 KB/s", "3.25 MB/s"
inline std::string formatSpeed(const double bytesPerSecond) {
    if (bytesPerSecond < 1024.0) return fmt::format("{:.0f} B/s", bytesPerSecond < 0.0 ? 0.0 : bytesPerSecond);
    if (bytesPerSecond < 1024.0 * 1024.0) return fmt::format("{:.2f} KB/s", bytesPerSecond / 1024.0);
    return fmt::format("{:.2f} MB/s", bytesPerSecond / (1024.0 * 1024.0));
}

}
