#include "ingest_relay/core/clock.hpp"
#include "ingest_relay/core/utils.hpp"

#include <thread>

namespace ingest_relay::core {

int64_t Clock::unix_seconds() const {
    return to_unix_seconds(now());
}

void Clock::sleep_seconds(double seconds) {
    if (seconds <= 0.0) {
        return;
    }
    sleep_for(std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0)));
}

std::chrono::system_clock::time_point SystemClock::now() const {
    return std::chrono::system_clock::now();
}

void SystemClock::sleep_for(std::chrono::milliseconds duration) {
    std::this_thread::sleep_for(duration);
}

ManualClock::ManualClock(std::chrono::system_clock::time_point start)
    : now_(start) {}

std::chrono::system_clock::time_point ManualClock::now() const {
    return now_;
}

void ManualClock::sleep_for(std::chrono::milliseconds duration) {
    now_ += duration;
    total_slept_ += duration;
    const int index = sleep_count_++;
    if (hook_) {
        hook_(index);
    }
}

} // namespace ingest_relay::core
