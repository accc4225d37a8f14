#pragma once

#include <export.hpp>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace Databrain {

using SystemTimePoint = std::chrono::system_clock::time_point;

/**
 * @brief High-resolution timer and high-level timing utilities.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    Timer() : start_(Clock::now()) {}

    /**
     * @brief Reset the timer to the current time.
     */
    void reset() {
        start_ = Clock::now();
    }

    /**
     * @brief Get elapsed milliseconds since last reset or construction.
     */
    double elapsed_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_).count();
    }

    /**
     * @brief Get elapsed seconds since last reset or construction.
     */
    double elapsed_sec() const {
        return elapsed_ms() / 1000.0;
    }

private:
    TimePoint start_;
};

/**
 * @brief Wall-clock source. Injected wherever "now" affects stored state.
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual SystemTimePoint now() const = 0;
};

class SystemClock : public Clock {
public:
    SystemTimePoint now() const override {
        return std::chrono::system_clock::now();
    }
};

/**
 * @brief Settable clock for tests and replays of historical runs.
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(SystemTimePoint start) : now_(start) {}

    SystemTimePoint now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void set(SystemTimePoint t) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = t;
    }

    template <typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> d) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += std::chrono::duration_cast<SystemTimePoint::duration>(d);
    }

private:
    mutable std::mutex mutex_;
    SystemTimePoint now_;
};

/**
 * @brief Microseconds since the Unix epoch (storage representation).
 */
DATABRAIN_API int64_t to_epoch_micros(SystemTimePoint t);
DATABRAIN_API SystemTimePoint from_epoch_micros(int64_t micros);

/**
 * @brief UTC calendar day number (days since 1970-01-01).
 */
DATABRAIN_API int64_t utc_day_number(SystemTimePoint t);

/**
 * @brief Fractional days from a to b (negative if b is earlier).
 */
DATABRAIN_API double days_between(SystemTimePoint a, SystemTimePoint b);

/**
 * @brief Build a UTC instant from civil date/time fields.
 */
DATABRAIN_API SystemTimePoint make_utc_time(int year, unsigned month, unsigned day,
                                            unsigned hour = 0, unsigned minute = 0, unsigned second = 0);

/**
 * @brief Format as ISO-8601 UTC with microseconds, e.g. 2026-10-16T08:30:00.000000Z
 */
DATABRAIN_API std::string format_iso8601(SystemTimePoint t);

} // namespace Databrain
