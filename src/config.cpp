/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <celltrack/config.hpp>

#include <algorithm>

namespace celltrack {

std::string locationModeToString(LocationMode mode) {
    switch (mode) {
        case LocationMode::SIMULATED: return "simulated";
        case LocationMode::CELL: return "cell";
        default: return "unknown";
    }
}

std::string Config::getPort() {
    return port;
}

void Config::setPort(const std::string &p) {
    port = p;
}

unsigned int Config::getBaud() {
    return baud;
}

void Config::setBaud(const unsigned int b) {
    baud = b;
}

std::string Config::getServerAddress() {
    return serverAddress;
}

void Config::setServerAddress(const std::string &address) {
    serverAddress = address;
}

uint32_t Config::getReportingInterval() {
    return reportingInterval;
}

void Config::setReportingInterval(const uint32_t seconds) {
    reportingInterval = std::clamp(seconds, MIN_INTERVAL_SECONDS, MAX_INTERVAL_SECONDS);
}

uint32_t Config::getReadingInterval() {
    if (readingInterval > reportingInterval) {
        return reportingInterval;
    }
    return readingInterval;
}

void Config::setReadingInterval(const uint32_t seconds) {
    readingInterval = std::clamp(seconds, MIN_INTERVAL_SECONDS, MAX_INTERVAL_SECONDS);
}

uint32_t Config::getMotionInterval() {
    return motionInterval;
}

void Config::setMotionInterval(const uint32_t seconds) {
    if (seconds > MAX_INTERVAL_SECONDS) {
        motionInterval = MAX_INTERVAL_SECONDS;
    } else {
        motionInterval = seconds;
    }
}

bool Config::hasImei() {
    return imei.has_value();
}

std::string Config::getImei() {
    return imei.value_or("");
}

void Config::setImei(const std::string &i) {
    if (i.empty()) {
        imei.reset();
    } else {
        imei = i;
    }
}

std::string Config::getCustomerCode() {
    return customerCode;
}

void Config::setCustomerCode(const std::string &code) {
    customerCode = code;
}

std::optional<std::string> Config::getApn() {
    return apn;
}

void Config::setApn(const std::string &a) {
    if (a.empty()) {
        apn.reset();
    } else {
        apn = a;
    }
}

LocationMode Config::getLocationMode() {
    return locationMode;
}

void Config::setLocationMode(const LocationMode mode) {
    locationMode = mode;
}

double Config::getLatitude() {
    return latitude;
}

void Config::setLatitude(const double l) {
    latitude = std::clamp(l, -90.0, 90.0);
}

double Config::getLongitude() {
    return longitude;
}

void Config::setLongitude(const double l) {
    longitude = std::clamp(l, -180.0, 180.0);
}

bool Config::getVerbose() {
    return verbose;
}

void Config::setVerbose(bool v) {
    verbose = v;
}

DeviceSettings Config::deviceSettings() {
    DeviceSettings settings;
    settings.serverAddress = getServerAddress();
    settings.reportingInterval = getReportingInterval();
    settings.readingInterval = getReadingInterval();
    settings.motionInterval = getMotionInterval();
    return settings;
}

}
