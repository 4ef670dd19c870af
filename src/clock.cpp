/*
 * cadence - Unattended Job Supervisor
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "cadence/clock.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace cadence {

TimePoint now() noexcept {
    return std::chrono::time_point_cast<Millis>(Clock::now());
}

std::string formatIso8601(TimePoint tp) {
    auto ms = tp.time_since_epoch().count();
    auto secs = ms / 1000;
    auto frac = ms % 1000;
    if (frac < 0) {
        frac += 1000;
        --secs;
    }

    std::time_t t = static_cast<std::time_t>(secs);
    std::tm utc{};
    gmtime_r(&t, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << frac << "Z";
    return ss.str();
}

std::optional<TimePoint> parseIso8601(const std::string& text) noexcept {
    try {
        std::tm utc{};
        std::istringstream ss(text);
        ss >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            return std::nullopt;
        }

        long frac = 0;
        if (ss.peek() == '.') {
            ss.get();
            int digits = 0;
            while (std::isdigit(ss.peek())) {
                char c = static_cast<char>(ss.get());
                // Anything finer than milliseconds is dropped
                if (digits < 3) {
                    frac = frac * 10 + (c - '0');
                }
                ++digits;
            }
            if (digits == 0) {
                return std::nullopt;
            }
            for (; digits < 3; ++digits) {
                frac *= 10;
            }
        }
        if (ss.get() != 'Z' || ss.peek() != std::char_traits<char>::eof()) {
            return std::nullopt;
        }

        std::time_t secs = timegm(&utc);
        return TimePoint(Millis(static_cast<long long>(secs) * 1000 + frac));
    } catch (...) {
        return std::nullopt;
    }
}

std::string formatDuration(Millis duration) {
    auto ms = duration.count();
    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    }
    if (ms < 60000) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.1fs", static_cast<double>(ms) / 1000.0);
        return buf;
    }
    auto minutes = ms / 60000;
    auto seconds = (ms % 60000) / 1000;
    return std::to_string(minutes) + "m " + std::to_string(seconds) + "s";
}

}
