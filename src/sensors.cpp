/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <celltrack/sensors.hpp>

#include <algorithm>
#include <cmath>

namespace celltrack {

namespace {

double roundTo(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

} // namespace

Sensors::Sensors(double latitude, double longitude, unsigned int seed)
    : rng_(seed), latitude_(latitude), longitude_(longitude) {}

double Sensors::uniform(double low, double high) {
    std::uniform_real_distribution<double> dist(low, high);
    return dist(rng_);
}

double Sensors::readTemperature() {
    std::lock_guard<std::mutex> lock(mutex_);
    return roundTo(uniform(18.0, 24.0), 1);
}

double Sensors::readHumidity() {
    std::lock_guard<std::mutex> lock(mutex_);
    return roundTo(uniform(35.0, 50.0), 1);
}

uint8_t Sensors::readBattery() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (uniform(1.0, 100.0) > 50.0) {
        battery_ -= 1;
    }
    if (battery_ < 5) {
        battery_ = 100;
    }
    return static_cast<uint8_t>(battery_);
}

GnssLocation Sensors::readLocation() {
    std::lock_guard<std::mutex> lock(mutex_);
    latitude_ += uniform(-0.0001, 0.0001);
    longitude_ += uniform(0.0001, 0.0003);
    return GnssLocation{
        static_cast<float>(roundTo(latitude_, 6)),
        static_cast<float>(roundTo(longitude_, 6))
    };
}

uint32_t Sensors::readSteps(uint32_t windowSeconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    double rate = uniform(0.8, 1.8);
    auto steps = static_cast<int64_t>(rate * std::max<uint32_t>(1, windowSeconds));
    std::uniform_int_distribution<int> noise(-5, 5);
    steps += noise(rng_);
    return static_cast<uint32_t>(std::max<int64_t>(0, steps));
}

} // namespace celltrack
