/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <celltrack/packets.hpp>
#include <spdlog/spdlog.h>

#include <stdexcept>

namespace celltrack {

namespace {

PacketHeader makeHeader(const Command& command, const std::string& deviceId, uint16_t transactionId) {
    PacketHeader header;
    header.version = PROTOCOL_VERSION;
    header.command = command;
    header.transactionId = transactionId;
    header.deviceId = deviceId;
    return header;
}

std::string describePayload(const PayloadVariant& payload) {
    if (auto location = std::get_if<Location>(&payload)) {
        return describe(*location);
    }
    if (auto reading = std::get_if<SensorReading>(&payload)) {
        return describe(*reading);
    }
    return describe(std::get<KeyValue>(payload));
}

} // namespace

Bytes Packet::encode() const {
    ByteWriter writer;
    encodeHeader(writer, header);
    if (timestamp.has_value()) {
        writer.u32(*timestamp);
    }
    writer.bytes(fields);
    for (const auto& payload : payloads) {
        encodePayload(writer, payload);
    }
    return writer.take();
}

std::string Packet::describe() const {
    std::string out = fmt::format("[{}] txn={}", header.command.toString(), header.transactionId);
    if (timestamp.has_value()) {
        out += fmt::format(" ts={}", *timestamp);
    }
    if (!fields.empty()) {
        out += fmt::format(" fields={}", toHex(fields));
    }
    for (const auto& payload : payloads) {
        out += " ";
        out += describePayload(payload);
    }
    return out;
}

Bytes parseCustomerCode(const std::string& code) {
    if (code.size() != 8) {
        throw std::invalid_argument(fmt::format("Customer code must be 8 hex digits: '{}'", code));
    }
    try {
        return fromHex(code);
    } catch (const DecodeError&) {
        throw std::invalid_argument(fmt::format("Customer code must be 8 hex digits: '{}'", code));
    }
}

Packet makePowerOnPacket(const std::string& deviceId, uint16_t transactionId, const PowerOnInfo& info) {
    Packet packet;
    packet.header = makeHeader(CMD_POWER_ON, deviceId, transactionId);

    ByteWriter writer;
    writer.bytes(parseCustomerCode(info.customerCode));
    writer.varString(info.softwareVersion);
    writer.varString(info.modemVersion);
    writer.varString(info.mcc);
    writer.varString(info.mnc);
    writer.varString(info.rat);
    packet.fields = writer.take();
    return packet;
}

Packet makeConfigPacket(const std::string& deviceId, uint16_t transactionId, const DeviceSettings& settings) {
    Packet packet;
    packet.header = makeHeader(CMD_CONFIG, deviceId, transactionId);
    packet.payloads.emplace_back(toKeyValue(settings));
    return packet;
}

Packet makeTelemetryPacket(const std::string& deviceId, uint16_t transactionId, uint32_t timestamp,
                           const Location& location, const SensorReading& reading) {
    Packet packet;
    packet.header = makeHeader(CMD_TELEMETRY, deviceId, transactionId);
    packet.timestamp = timestamp;
    packet.payloads.emplace_back(location);
    packet.payloads.emplace_back(reading);
    return packet;
}

Packet makeMotionPacket(const std::string& deviceId, uint16_t transactionId, uint32_t timestamp,
                        const Location& location, const SensorMotion& motion) {
    Packet packet;
    packet.header = makeHeader(CMD_MOTION, deviceId, transactionId);
    packet.timestamp = timestamp;
    packet.payloads.emplace_back(location);
    packet.payloads.emplace_back(SensorReading{motion});
    return packet;
}

Packet makeFirmwarePacket(const std::string& deviceId, uint16_t transactionId,
                          const std::string& version, const std::string& status) {
    Packet packet;
    packet.header = makeHeader(CMD_FIRMWARE, deviceId, transactionId);
    KeyValue kv;
    kv.add("version", version);
    kv.add("status", status);
    packet.payloads.emplace_back(std::move(kv));
    return packet;
}

} // namespace celltrack
