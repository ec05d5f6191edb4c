/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <celltrack/settings.hpp>
#include <spdlog/spdlog.h>

#include <charconv>
#include <stdexcept>

using spdlog::warn;

namespace celltrack {

namespace {

uint32_t parseSeconds(const std::string& key, const std::string& value, uint32_t minimum) {
    uint32_t seconds = 0;
    auto result = std::from_chars(value.data(), value.data() + value.size(), seconds);
    if (result.ec != std::errc{} || result.ptr != value.data() + value.size()) {
        throw std::invalid_argument(fmt::format("Setting '{}' is not a number: '{}'", key, value));
    }
    if (seconds != 0 && (seconds < minimum || seconds > MAX_INTERVAL_SECONDS)) {
        throw std::invalid_argument(fmt::format("Setting '{}' out of range: {}", key, seconds));
    }
    if (seconds == 0 && minimum > 0) {
        throw std::invalid_argument(fmt::format("Setting '{}' must not be zero", key));
    }
    return seconds;
}

} // namespace

KeyValue toKeyValue(const DeviceSettings& settings) {
    KeyValue kv;
    kv.add("server", settings.serverAddress);
    kv.add("interval", std::to_string(settings.reportingInterval));
    kv.add("readings", std::to_string(settings.readingInterval));
    kv.add("motion", std::to_string(settings.motionInterval));
    return kv;
}

DeviceSettings applyKeyValue(const DeviceSettings& current, const KeyValue& update) {
    DeviceSettings next = current;
    for (const auto& [key, value] : update.entries) {
        if (key == "server") {
            if (value.find(':') == std::string::npos) {
                throw std::invalid_argument(fmt::format("Server address must be <host>:<port>: '{}'", value));
            }
            next.serverAddress = value;
        } else if (key == "interval") {
            next.reportingInterval = parseSeconds(key, value, MIN_INTERVAL_SECONDS);
        } else if (key == "readings") {
            next.readingInterval = parseSeconds(key, value, MIN_INTERVAL_SECONDS);
        } else if (key == "motion") {
            next.motionInterval = parseSeconds(key, value, 0);
        } else {
            warn("Ignoring unknown setting '{}'", key);
        }
    }
    if (next.readingInterval > next.reportingInterval) {
        throw std::invalid_argument(fmt::format("Reading interval {}s exceeds reporting interval {}s",
            next.readingInterval, next.reportingInterval));
    }
    auto size = toKeyValue(next).encodedSize();
    if (size > MAX_FRAMED_BODY) {
        throw std::invalid_argument(fmt::format("Settings need {} bytes, a configuration packet holds {}",
            size, MAX_FRAMED_BODY));
    }
    return next;
}

std::shared_ptr<const DeviceSettings> SettingsStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

void SettingsStore::replace(DeviceSettings settings) {
    auto next = std::make_shared<const DeviceSettings>(std::move(settings));
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = std::move(next);
}

} // namespace celltrack
