/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __CELLTRACK_PACKETS_HPP
#define __CELLTRACK_PACKETS_HPP

#include <celltrack/codec.hpp>
#include <celltrack/payload.hpp>
#include <celltrack/settings.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace celltrack {

// Outbound command codes
inline const Command CMD_POWER_ON{'P', '+'};
inline const Command CMD_CONFIG{'C', '\0'};
inline const Command CMD_TELEMETRY{'T', '\0'};
inline const Command CMD_MOTION{'M', '\0'};
inline const Command CMD_FIRMWARE{'F', '\0'};

// Inbound command codes, matched on the first character
constexpr char INBOUND_ACK = 'A';
constexpr char INBOUND_CONFIG_READ = 'C';
constexpr char INBOUND_CONFIG_WRITE = 'W';
constexpr char INBOUND_FIRMWARE = 'F';

/**
 * An application packet: header, optional timestamp, fixed fields and
 * payload variants, serialized in that order.
 */
struct Packet {
    PacketHeader header;
    std::optional<uint32_t> timestamp;
    Bytes fields;
    std::vector<PayloadVariant> payloads;

    Bytes encode() const;

    /** One line summary for logs */
    std::string describe() const;
};

struct PowerOnInfo {
    // 8 hex digits, sent as 4 raw bytes
    std::string customerCode = "00000000";
    std::string softwareVersion;
    std::string modemVersion;
    std::string mcc;
    std::string mnc;
    std::string rat;
};

Packet makePowerOnPacket(const std::string& deviceId, uint16_t transactionId, const PowerOnInfo& info);

Packet makeConfigPacket(const std::string& deviceId, uint16_t transactionId, const DeviceSettings& settings);

Packet makeTelemetryPacket(const std::string& deviceId, uint16_t transactionId, uint32_t timestamp,
                           const Location& location, const SensorReading& reading);

Packet makeMotionPacket(const std::string& deviceId, uint16_t transactionId, uint32_t timestamp,
                        const Location& location, const SensorMotion& motion);

Packet makeFirmwarePacket(const std::string& deviceId, uint16_t transactionId,
                          const std::string& version, const std::string& status);

/** Validates and converts an 8 hex digit customer code. Throws std::invalid_argument. */
Bytes parseCustomerCode(const std::string& code);

} // namespace celltrack

#endif
