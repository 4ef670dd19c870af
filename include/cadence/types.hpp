#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace cadence {

using Clock = std::chrono::system_clock;
using TimePoint = std::chrono::time_point<Clock, std::chrono::milliseconds>;
using Millis = std::chrono::milliseconds;

// Outcome of one scheduled run across all enabled jobs.
enum class RunStatus : std::uint8_t { Completed, Failed, Partial };

// Job names double as directory names and the AVATAR_NAME value.
using JobName = std::string;

} // namespace cadence
