#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace ferry::utils {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using NowFn = std::function<TimePoint()>;

// Default clock source for components that take an injectable clock
inline NowFn steady_now() {
    return [] { return Clock::now(); };
}

// Wall-clock milliseconds since the Unix epoch, used for persisted timestamps
inline int64_t unix_time_ms() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();
}

using WallNowFn = std::function<int64_t()>;

inline WallNowFn system_now_ms() {
    return [] { return unix_time_ms(); };
}

}  // namespace ferry::utils
