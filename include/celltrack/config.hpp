/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __CELLTRACK_CONFIG_HPP
#define __CELLTRACK_CONFIG_HPP

#include <celltrack/settings.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace celltrack {

enum class LocationMode {
    SIMULATED,
    CELL
};

std::string locationModeToString(LocationMode mode);

class Config {
public:
    // Empty constructor
    Config() = default;
    ~Config() = default;

    std::string getPort();
    void setPort(const std::string &port);

    unsigned int getBaud();
    void setBaud(const unsigned int baud);

    std::string getServerAddress();
    void setServerAddress(const std::string &address);

    uint32_t getReportingInterval();
    void setReportingInterval(const uint32_t seconds);

    // Never longer than the reporting interval
    uint32_t getReadingInterval();
    void setReadingInterval(const uint32_t seconds);

    // 0 disables motion reports
    uint32_t getMotionInterval();
    void setMotionInterval(const uint32_t seconds);

    bool hasImei();
    std::string getImei();
    void setImei(const std::string &imei);

    std::string getCustomerCode();
    void setCustomerCode(const std::string &code);

    std::optional<std::string> getApn();
    void setApn(const std::string &apn);

    LocationMode getLocationMode();
    void setLocationMode(const LocationMode mode);

    double getLatitude();
    void setLatitude(const double l);

    double getLongitude();
    void setLongitude(const double l);

    bool getVerbose();
    void setVerbose(bool);

    /** Initial runtime settings */
    DeviceSettings deviceSettings();

private:
    std::string port = "/dev/ttyUSB0";
    unsigned int baud = 115200;
    std::string serverAddress = "udp-eu.tartabit.com:10106";
    uint32_t reportingInterval = 120;
    uint32_t readingInterval = 60;
    uint32_t motionInterval = 0;
    std::optional<std::string> imei;
    std::string customerCode = "00000000";
    std::optional<std::string> apn;
    LocationMode locationMode = LocationMode::SIMULATED;
    double latitude = 45.448803450183924;
    double longitude = -75.63533774831912;
    bool verbose = false;
};

}

#endif
