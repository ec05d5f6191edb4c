/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <celltrack/packets.hpp>

#include <stdexcept>
#include <variant>

namespace celltrack {
namespace {

const std::string DEVICE_ID = "358419511056392";

class PacketsTest : public ::testing::Test {
protected:
    DecodedPacket decode(const Packet& packet) {
        return decodeHeader(packet.encode());
    }
};

// ============================================================================
// Power On Tests
// ============================================================================

TEST_F(PacketsTest, PowerOn_Layout) {
    PowerOnInfo info;
    info.customerCode = "0A0B0C0D";
    info.softwareVersion = "1.0.0";
    info.modemVersion = "RK_03";
    info.mcc = "302";
    info.mnc = "720";
    info.rat = "LTE-M";

    auto decoded = decode(makePowerOnPacket(DEVICE_ID, 1, info));
    EXPECT_EQ(decoded.header.command, CMD_POWER_ON);
    EXPECT_EQ(decoded.header.transactionId, 1);
    EXPECT_EQ(decoded.header.deviceId, "0358419511056392");

    ByteReader reader(decoded.payload);
    EXPECT_EQ(reader.u32(), 0x0A0B0C0Du);
    EXPECT_EQ(reader.varString(), "1.0.0");
    EXPECT_EQ(reader.varString(), "RK_03");
    EXPECT_EQ(reader.varString(), "302");
    EXPECT_EQ(reader.varString(), "720");
    EXPECT_EQ(reader.varString(), "LTE-M");
    EXPECT_TRUE(reader.empty());
}

TEST_F(PacketsTest, PowerOn_InvalidCustomerCode_Throws) {
    PowerOnInfo info;
    info.customerCode = "XYZ";
    EXPECT_THROW(makePowerOnPacket(DEVICE_ID, 1, info), std::invalid_argument);
}

TEST_F(PacketsTest, CustomerCode_Validation) {
    EXPECT_EQ(parseCustomerCode("00000000"), Bytes(4, 0x00));
    EXPECT_EQ(parseCustomerCode("DEADbeef"), (Bytes{0xDE, 0xAD, 0xBE, 0xEF}));
    EXPECT_THROW(parseCustomerCode("1234567"), std::invalid_argument);
    EXPECT_THROW(parseCustomerCode("123456789"), std::invalid_argument);
    EXPECT_THROW(parseCustomerCode("1234567G"), std::invalid_argument);
}

// ============================================================================
// Configuration Tests
// ============================================================================

TEST_F(PacketsTest, Config_CarriesSettingsAsKeyValue) {
    DeviceSettings settings;
    settings.serverAddress = "collector.example.com:10106";
    settings.reportingInterval = 300;
    settings.readingInterval = 30;
    settings.motionInterval = 600;

    auto decoded = decode(makeConfigPacket(DEVICE_ID, 42, settings));
    EXPECT_EQ(decoded.header.command, CMD_CONFIG);
    EXPECT_EQ(decoded.header.transactionId, 42);

    ByteReader reader(decoded.payload);
    auto kv = decodeKeyValue(reader);
    EXPECT_TRUE(reader.empty());
    EXPECT_EQ(kv.get("server").value_or(""), "collector.example.com:10106");
    EXPECT_EQ(kv.get("interval").value_or(""), "300");
    EXPECT_EQ(kv.get("readings").value_or(""), "30");
    EXPECT_EQ(kv.get("motion").value_or(""), "600");
}

// ============================================================================
// Telemetry / Motion Tests
// ============================================================================

TEST_F(PacketsTest, Telemetry_TimestampLocationAndSensor) {
    SensorMulti multi;
    multi.battery = 99;
    multi.rssi = 21;
    multi.firstReading = 1735689600;
    multi.interval = 60;
    multi.records = {{20.1, 40.2}, {20.3, 40.4}};

    auto packet = makeTelemetryPacket(DEVICE_ID, 7, 1735689720, GnssLocation{45.5f, -75.6f}, multi);
    auto decoded = decode(packet);
    EXPECT_EQ(decoded.header.command, CMD_TELEMETRY);

    ByteReader reader(decoded.payload);
    EXPECT_EQ(reader.u32(), 1735689720u);

    auto location = decodeLocation(reader);
    ASSERT_TRUE(std::holds_alternative<GnssLocation>(location));
    EXPECT_FLOAT_EQ(std::get<GnssLocation>(location).latitude, 45.5f);

    auto sensor = decodeSensor(reader);
    ASSERT_TRUE(sensor.has_value());
    ASSERT_TRUE(std::holds_alternative<SensorMulti>(*sensor));
    EXPECT_EQ(std::get<SensorMulti>(*sensor).records.size(), 2u);
    EXPECT_TRUE(reader.empty());
}

TEST_F(PacketsTest, Motion_CarriesMotionSummary) {
    SensorMotion motion{70, 18, 1735689600, 600, 800};
    CellLocation cell{"302", "720", "5DC", "1A2B3C", -90};

    auto decoded = decode(makeMotionPacket(DEVICE_ID, 8, 1735690200, cell, motion));
    EXPECT_EQ(decoded.header.command, CMD_MOTION);

    ByteReader reader(decoded.payload);
    EXPECT_EQ(reader.u32(), 1735690200u);
    auto location = decodeLocation(reader);
    ASSERT_TRUE(std::holds_alternative<CellLocation>(location));
    auto sensor = decodeSensor(reader);
    ASSERT_TRUE(sensor.has_value());
    ASSERT_TRUE(std::holds_alternative<SensorMotion>(*sensor));
    EXPECT_EQ(std::get<SensorMotion>(*sensor).steps, 800u);
}

// ============================================================================
// Firmware Tests
// ============================================================================

TEST_F(PacketsTest, Firmware_CarriesVersionAndStatus) {
    auto decoded = decode(makeFirmwarePacket(DEVICE_ID, 9, "2.1.0", "complete"));
    EXPECT_EQ(decoded.header.command, CMD_FIRMWARE);

    ByteReader reader(decoded.payload);
    auto kv = decodeKeyValue(reader);
    EXPECT_EQ(kv.get("version").value_or(""), "2.1.0");
    EXPECT_EQ(kv.get("status").value_or(""), "complete");
}

// ============================================================================
// Description Tests
// ============================================================================

TEST_F(PacketsTest, Describe_IncludesCommandAndTransaction) {
    auto packet = makeFirmwarePacket(DEVICE_ID, 9, "2.1.0", "complete");
    EXPECT_EQ(packet.describe(), "[F\\0] txn=9 {version=2.1.0, status=complete}");
}

} // namespace
} // namespace celltrack
