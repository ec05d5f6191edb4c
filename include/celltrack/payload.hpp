/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __CELLTRACK_PAYLOAD_HPP
#define __CELLTRACK_PAYLOAD_HPP

#include <celltrack/codec.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace celltrack {

enum class LocationType : uint8_t {
    GNSS = 1,
    Cell = 2
};

enum class SensorType : uint8_t {
    Null = 0,
    Basic = 1,
    Multi = 2,
    MotionSummary = 3
};

enum class KeyValueType : uint8_t {
    Pairs = 1
};

constexpr uint8_t SENSOR_VERSION = 1;
constexpr uint8_t KEY_VALUE_VERSION = 1;

/** Records that still fit a 255 byte Multi payload */
constexpr std::size_t MAX_SENSOR_RECORDS = 61;

// Largest body a type | version | length frame can carry
constexpr std::size_t MAX_FRAMED_BODY = 255;

// === Location ===

struct GnssLocation {
    float latitude = 0.0f;
    float longitude = 0.0f;
};

struct CellLocation {
    std::string mcc;
    std::string mnc;
    std::string lac;
    std::string cellId;
    int8_t rssi = 0;
};

using Location = std::variant<GnssLocation, CellLocation>;

// === Sensor readings ===

struct SensorNull {};

struct SensorBasic {
    double temperature = 0.0;
    double humidity = 0.0;
    uint8_t battery = 0;
    uint8_t rssi = 0;
};

struct SensorRecord {
    double temperature = 0.0;
    double humidity = 0.0;
};

/**
 * A time series of temperature/humidity records taken every `interval`
 * seconds starting at `firstReading`.
 */
struct SensorMulti {
    uint8_t battery = 0;
    uint8_t rssi = 0;
    uint32_t firstReading = 0;
    uint16_t interval = 0;
    std::vector<SensorRecord> records;
};

/** Step count observed over a motion window */
struct SensorMotion {
    uint8_t battery = 0;
    uint8_t rssi = 0;
    uint32_t windowStart = 0;
    uint16_t windowSeconds = 0;
    uint32_t steps = 0;
};

using SensorReading = std::variant<SensorNull, SensorBasic, SensorMulti, SensorMotion>;

// === Key/value ===

struct KeyValue {
    std::vector<std::pair<std::string, std::string>> entries;

    void add(std::string key, std::string value);

    /** First value stored under `key` */
    std::optional<std::string> get(std::string_view key) const;

    /** Size of the framed body: the count byte and every length-prefixed key and value */
    std::size_t encodedSize() const;
};

/** Any payload that can follow a packet header */
using PayloadVariant = std::variant<Location, SensorReading, KeyValue>;

// === Scaling ===

/** round(value * 10) as a signed 16 bit field; out of range values are a producer bug */
int16_t scaleTenths(double value);
double unscaleTenths(int16_t value);

// === Encoding ===

void encodeLocation(ByteWriter& writer, const Location& location);
void encodeSensor(ByteWriter& writer, const SensorReading& reading);
void encodeKeyValue(ByteWriter& writer, const KeyValue& kv);
void encodePayload(ByteWriter& writer, const PayloadVariant& payload);

// === Decoding ===

Location decodeLocation(ByteReader& reader);

/**
 * Decodes one sensor structure. Unknown sensor types and versions are
 * skipped using their length byte and reported as std::nullopt.
 */
std::optional<SensorReading> decodeSensor(ByteReader& reader);

KeyValue decodeKeyValue(ByteReader& reader);

// === Descriptions for logging ===

std::string describe(const Location& location);
std::string describe(const SensorReading& reading);
std::string describe(const KeyValue& kv);

} // namespace celltrack

#endif
