// File: common/timer.hpp

#ifndef TIMER_HPP
#define TIMER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "common/logging/logger.hpp"

/* Destroys itself without requiring a manual call to stop() - via the destructor. */
class Timer {
public:
    explicit Timer(std::string name) :
        name_(std::move(name)), start_time_(std::chrono::steady_clock::now()), stopped_(false) {
        LOG_DEBUG("Started timer for [{}].", name_);
    }

    ~Timer() {
        if (!stopped_) {
            stop();
        }
    }

    // Stop the timer and log the duration
    void stop() noexcept {
        if (!stopped_.exchange(true)) {
            const auto end_time = std::chrono::steady_clock::now();
            const auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time_).count();
            LOG_INFO("Execution time of {}: {} ({} µs).", name_, toHumanReadable(duration), duration);
        }
    }

    Timer(Timer &&) = delete;
    Timer &operator=(Timer &&) = delete;
    Timer(const Timer &) = delete;
    Timer &operator=(const Timer &) = delete;

private:
    std::string name_;
    std::chrono::time_point<std::chrono::steady_clock> start_time_;
    std::atomic<bool> stopped_;

    static std::string toHumanReadable(const int64_t micros) {
        using namespace std::chrono;

        auto duration = microseconds(micros);
        const auto m = duration_cast<minutes>(duration);
        duration -= m;
        const auto s = duration_cast<seconds>(duration);
        duration -= s;
        const auto ms = duration_cast<milliseconds>(duration);
        duration -= ms;

        return fmt::format("{}{}{}{}µs", m.count() > 0 ? fmt::format("{}m ", m.count()) : "",
                           s.count() > 0 || m.count() > 0 ? fmt::format("{}s ", s.count()) : "",
                           ms.count() > 0 || s.count() > 0 || m.count() > 0 ? fmt::format("{}ms ", ms.count()) : "",
                           duration.count());
    }
};

#endif // TIMER_HPP
