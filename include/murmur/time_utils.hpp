#pragma once

#include "murmur/common.hpp"
#include <chrono>
#include <thread>

namespace murmur {
namespace time {

using Milliseconds = std::chrono::milliseconds;

// Duration utilities
template<typename Rep, typename Period>
inline uint64_t duration_to_milliseconds(const std::chrono::duration<Rep, Period>& duration) {
    return std::chrono::duration_cast<Milliseconds>(duration).count();
}

// Current Unix timestamp (milliseconds since epoch)
inline uint64_t timestamp_milliseconds() {
    return duration_to_milliseconds(std::chrono::system_clock::now().time_since_epoch());
}

// Age of a timestamp relative to now_ms, zero for timestamps in the future
inline uint64_t age_ms(uint64_t timestamp_ms, uint64_t now_ms) {
    return now_ms > timestamp_ms ? now_ms - timestamp_ms : 0;
}

// Timer for measuring elapsed time
class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}
    
    uint64_t elapsed_milliseconds() const {
        return duration_to_milliseconds(std::chrono::steady_clock::now() - start_);
    }
    
private:
    std::chrono::steady_clock::time_point start_;
};

inline void sleep_milliseconds(uint32_t milliseconds) {
    std::this_thread::sleep_for(Milliseconds(milliseconds));
}

} // namespace time
} // namespace murmur
