#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace ctxsys::core {

// JSON alias
using Json = nlohmann::json;

// Time types
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

// Common type aliases
using ProjectId = std::string;
using SessionId = std::string;
using CheckpointId = std::string;
using MemoryItemId = std::string;
using StepId = std::string;

// Timestamps are kept at millisecond precision everywhere so that a value
// written to storage reads back equal to the in-memory one.
inline TimePoint now() {
    return std::chrono::time_point_cast<Duration>(Clock::now());
}

inline int64_t to_epoch_ms(TimePoint tp) {
    return std::chrono::duration_cast<Duration>(tp.time_since_epoch()).count();
}

inline TimePoint from_epoch_ms(int64_t ms) {
    return TimePoint{Duration{ms}};
}

inline int64_t elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<Duration>(
        std::chrono::steady_clock::now() - since).count();
}

}  // namespace ctxsys::core
