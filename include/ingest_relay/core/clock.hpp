#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <utility>

namespace ingest_relay::core {

/**
 * Source of wall time and of every voluntary wait in the pipeline.
 * Poll intervals, retry delays and trigger polling all sleep through this
 * interface so tests can drive them without real waiting.
 */
class Clock {
public:
    virtual ~Clock() = default;

    virtual std::chrono::system_clock::time_point now() const = 0;
    virtual void sleep_for(std::chrono::milliseconds duration) = 0;

    int64_t unix_seconds() const;
    void sleep_seconds(double seconds);
};

class SystemClock : public Clock {
public:
    std::chrono::system_clock::time_point now() const override;
    void sleep_for(std::chrono::milliseconds duration) override;
};

/**
 * Manually advanced clock for deterministic tests.
 * sleep_for() advances the current time instantly and then runs the optional
 * hook, which lets a test mutate the filesystem "while" the caller waits.
 */
class ManualClock : public Clock {
public:
    using SleepHook = std::function<void(int sleep_index)>;

    explicit ManualClock(std::chrono::system_clock::time_point start =
                             std::chrono::system_clock::time_point(std::chrono::seconds(1700000000)));

    std::chrono::system_clock::time_point now() const override;
    void sleep_for(std::chrono::milliseconds duration) override;

    void advance(std::chrono::milliseconds duration) { now_ += duration; }
    void set_sleep_hook(SleepHook hook) { hook_ = std::move(hook); }

    int sleep_count() const { return sleep_count_; }
    std::chrono::milliseconds total_slept() const { return total_slept_; }

private:
    std::chrono::system_clock::time_point now_;
    SleepHook hook_;
    int sleep_count_ = 0;
    std::chrono::milliseconds total_slept_{0};
};

} // namespace ingest_relay::core
