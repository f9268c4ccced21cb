#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <utility>

namespace sm::sync {

// Bytes per second over a sliding window of recent samples.
class SpeedMeter {
public:
    using Clock = std::chrono::steady_clock;

    explicit SpeedMeter(const std::chrono::milliseconds window = std::chrono::seconds(3)) : window_(window) {}

    void reset() { samples_.clear(); }

    void add(const uint64_t bytes, const Clock::time_point now = Clock::now()) {
        samples_.emplace_back(now, bytes);
        while (samples_.size() > 1 && now - samples_.front().first > window_) samples_.pop_front();
    }

    [[nodiscard]] double bytesPerSecond() const {
        if (samples_.size() < 2) return 0.0;
        const auto elapsed = std::chrono::duration<double>(samples_.back().first - samples_.front().first).count();
        if (elapsed <= 0.0) return 0.0;

        uint64_t total = 0;
        for (auto it = std::next(samples_.begin()); it != samples_.end(); ++it) total += it->second;
        return static_cast<double>(total) / elapsed;
    }

private:
    std::chrono::milliseconds window_;
    std::deque<std::pair<Clock::time_point, uint64_t>> samples_;
};

}
