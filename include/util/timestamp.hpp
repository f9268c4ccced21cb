#pragma once

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace sm::util {

inline std::string timestampToString(const std::time_t ts) {
    std::tm tm{};
    gmtime_r(&ts, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ"); // ISO 8601 UTC
    return oss.str();
}

namespace detail {

inline bool readDigits(const std::string& s, const size_t pos, const size_t count, int& out) {
    if (pos + count > s.size()) return false;
    out = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        out = out * 10 + (s[i] - '0');
    }
    return true;
}

}

// Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM" and "YYYY-MM-DDTHH:MM:SS" (a space works
// as separator), optional fractional seconds, then "Z", "+HH:MM"/"-HH:MM", or
// nothing (local time).
inline std::time_t parseIso8601(const std::string& iso) {
    const auto fail = [&iso]() -> std::invalid_argument {
        return std::invalid_argument("Failed to parse timestamp: " + iso);
    };

    int year, month, day, hour = 0, minute = 0, second = 0;
    if (!detail::readDigits(iso, 0, 4, year) || iso.size() < 10 || iso[4] != '-' ||
        !detail::readDigits(iso, 5, 2, month) || iso[7] != '-' || !detail::readDigits(iso, 8, 2, day))
        throw fail();

    size_t pos = 10;
    if (pos < iso.size() && (iso[pos] == 'T' || iso[pos] == 't' || iso[pos] == ' ')) {
        if (!detail::readDigits(iso, 11, 2, hour) || iso.size() < 16 || iso[13] != ':' ||
            !detail::readDigits(iso, 14, 2, minute))
            throw fail();
        pos = 16;

        if (pos < iso.size() && iso[pos] == ':') {
            if (!detail::readDigits(iso, 17, 2, second)) throw fail();
            pos = 19;
            if (pos < iso.size() && iso[pos] == '.') {
                ++pos;
                while (pos < iso.size() && std::isdigit(static_cast<unsigned char>(iso[pos]))) ++pos;
            }
        }
    }

    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) throw fail();

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;

    if (pos == iso.size()) {
        tm.tm_isdst = -1;
        return std::mktime(&tm);
    }

    const auto zone = iso.substr(pos);
    if (zone == "Z" || zone == "z") return timegm(&tm);

    int zoneHours, zoneMinutes;
    if (zone.size() == 6 && (zone[0] == '+' || zone[0] == '-') && zone[3] == ':' &&
        detail::readDigits(zone, 1, 2, zoneHours) && detail::readDigits(zone, 4, 2, zoneMinutes)) {
        const int offset = (zoneHours * 3600 + zoneMinutes * 60) * (zone[0] == '-' ? -1 : 1);
        return timegm(&tm) - offset;
    }

    throw std::invalid_argument("Unsupported timezone designator in timestamp: " + iso);
}

inline std::time_t nowSeconds() {
    return std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
}

}
