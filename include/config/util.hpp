#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace sm::config {

namespace detail {

inline std::string lower(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return std::tolower(c); });
    return s;
}

inline bool endsWith(const std::string& str, const std::string& suffix) {
    return str.size() > suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline uintmax_t leadingNumber(const std::string& str, const size_t suffixLen) {
    const auto digits = str.substr(0, str.size() - suffixLen);
    if (digits.empty() || !std::ranges::all_of(digits, [](const unsigned char c) { return std::isdigit(c); }))
        throw std::invalid_argument("Invalid numeric value: " + str);
    return std::stoull(digits);
}

}

// "64KB", "1MB", "512B", "65536" (bytes when no suffix)
inline uintmax_t parseSizeToBytes(const std::string& raw) {
    if (raw.empty()) throw std::invalid_argument("Size string cannot be empty");
    const auto str = detail::lower(raw);

    if (detail::endsWith(str, "gb")) return detail::leadingNumber(str, 2) * 1024 * 1024 * 1024;
    if (detail::endsWith(str, "mb")) return detail::leadingNumber(str, 2) * 1024 * 1024;
    if (detail::endsWith(str, "kb")) return detail::leadingNumber(str, 2) * 1024;
    if (detail::endsWith(str, "g")) return detail::leadingNumber(str, 1) * 1024 * 1024 * 1024;
    if (detail::endsWith(str, "m")) return detail::leadingNumber(str, 1) * 1024 * 1024;
    if (detail::endsWith(str, "k")) return detail::leadingNumber(str, 1) * 1024;
    if (detail::endsWith(str, "b")) return detail::leadingNumber(str, 1);

    return detail::leadingNumber(str, 0);
}

// "1500ms", "2s", "1m" (milliseconds when no suffix)
inline std::chrono::milliseconds parseDurationMs(const std::string& raw) {
    if (raw.empty()) throw std::invalid_argument("Duration string cannot be empty");
    const auto str = detail::lower(raw);

    if (detail::endsWith(str, "ms")) return std::chrono::milliseconds(detail::leadingNumber(str, 2));
    if (detail::endsWith(str, "s")) return std::chrono::seconds(detail::leadingNumber(str, 1));
    if (detail::endsWith(str, "m")) return std::chrono::minutes(detail::leadingNumber(str, 1));

    return std::chrono::milliseconds(detail::leadingNumber(str, 0));
}

inline std::string bytesToSizeStr(const uintmax_t bytes) {
    if (bytes != 0 && bytes % (1024 * 1024) == 0) return std::to_string(bytes / (1024 * 1024)) + "MB";
    if (bytes != 0 && bytes % 1024 == 0) return std::to_string(bytes / 1024) + "KB";
    return std::to_string(bytes) + "B";
}

inline std::string durationToStr(const std::chrono::milliseconds ms) {
    if (ms.count() != 0 && ms.count() % 1000 == 0) return std::to_string(ms.count() / 1000) + "s";
    return std::to_string(ms.count()) + "ms";
}

}
