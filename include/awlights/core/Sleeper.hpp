#pragma once

#include <chrono>
#include <functional>
#include <thread>

namespace awlights::core {

/**
 * @brief Blocking wait used for every firmware-mandated inter-command delay.
 *
 * Devices take one at construction so tests can record the requested delays
 * instead of waiting them out. The durations themselves are minimum intervals
 * found empirically on hardware and must not be shortened.
 */
using Sleeper = std::function<void(std::chrono::milliseconds)>;

inline Sleeper defaultSleeper() {
    return [](std::chrono::milliseconds duration) {
        std::this_thread::sleep_for(duration);
    };
}

} // namespace awlights::core
