/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __CELLTRACK_SETTINGS_HPP
#define __CELLTRACK_SETTINGS_HPP

#include <celltrack/payload.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace celltrack {

constexpr uint32_t MIN_INTERVAL_SECONDS = 10;
constexpr uint32_t MAX_INTERVAL_SECONDS = 86400;

/**
 * Device settings that the collector may read and rewrite at runtime.
 * Producers work from one immutable snapshot per cycle.
 */
struct DeviceSettings {
    std::string serverAddress;
    uint32_t reportingInterval = 120;
    uint32_t readingInterval = 60;
    // 0 disables the motion cycle
    uint32_t motionInterval = 0;

    bool operator==(const DeviceSettings& other) const = default;
};

/** Settings as the key/value list carried by configuration packets */
KeyValue toKeyValue(const DeviceSettings& settings);

/**
 * Applies a key/value update on top of `current`.
 * Throws std::invalid_argument when a known key carries an invalid value or
 * the result no longer fits in a configuration packet; unknown keys are
 * logged and ignored.
 */
DeviceSettings applyKeyValue(const DeviceSettings& current, const KeyValue& update);

/**
 * Holds the current DeviceSettings snapshot. Replacing it is atomic with
 * respect to readers, who always see a complete snapshot.
 */
class SettingsStore {
public:
    explicit SettingsStore(DeviceSettings initial)
        : current_(std::make_shared<const DeviceSettings>(std::move(initial))) {}

    SettingsStore(const SettingsStore&) = delete;
    SettingsStore& operator=(const SettingsStore&) = delete;

    std::shared_ptr<const DeviceSettings> snapshot() const;
    void replace(DeviceSettings settings);

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const DeviceSettings> current_;
};

} // namespace celltrack

#endif
