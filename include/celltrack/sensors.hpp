/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __CELLTRACK_SENSORS_HPP
#define __CELLTRACK_SENSORS_HPP

#include <celltrack/payload.hpp>

#include <cstdint>
#include <mutex>
#include <random>

namespace celltrack {

// Ottawa, Canada
constexpr double DEFAULT_LATITUDE = 45.448803450183924;
constexpr double DEFAULT_LONGITUDE = -75.63533774831912;

/**
 * Simulated environmental sensors, battery and GNSS receiver.
 * Thread-safe.
 */
class Sensors {
public:
    Sensors(double latitude = DEFAULT_LATITUDE, double longitude = DEFAULT_LONGITUDE, unsigned int seed = std::random_device{}());

    // Non-copyable, non-movable (due to mutex)
    Sensors(const Sensors&) = delete;
    Sensors& operator=(const Sensors&) = delete;

    /** Degrees Celsius, 18.0 to 24.0, one decimal */
    double readTemperature();

    /** Relative humidity, 35.0 to 50.0 %, one decimal */
    double readHumidity();

    /** Battery percentage; drains by one on roughly half the reads and resets to 100 below 5 */
    uint8_t readBattery();

    /** Random walk with an eastward bias */
    GnssLocation readLocation();

    /** Steps taken over a window, about 0.8 to 1.8 per second plus noise */
    uint32_t readSteps(uint32_t windowSeconds);

private:
    std::mutex mutex_;
    std::mt19937 rng_;
    double latitude_;
    double longitude_;
    int battery_ = 100;

    double uniform(double low, double high);
};

} // namespace celltrack

#endif
