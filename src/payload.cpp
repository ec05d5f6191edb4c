/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <celltrack/payload.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace celltrack {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

void KeyValue::add(std::string key, std::string value) {
    entries.emplace_back(std::move(key), std::move(value));
}

std::optional<std::string> KeyValue::get(std::string_view key) const {
    for (const auto& [k, v] : entries) {
        if (k == key) {
            return v;
        }
    }
    return std::nullopt;
}

int16_t scaleTenths(double value) {
    double scaled = std::round(value * 10.0);
    if (!std::isfinite(scaled) ||
        scaled < std::numeric_limits<int16_t>::min() ||
        scaled > std::numeric_limits<int16_t>::max()) {
        throw std::out_of_range(fmt::format("Value {} cannot be encoded in tenths as int16", value));
    }
    return static_cast<int16_t>(scaled);
}

double unscaleTenths(int16_t value) {
    return value / 10.0;
}

///// Encoding /////

namespace {

/** Writes type | version | length | body, the framing shared by all self-describing variants */
void writeFramed(ByteWriter& writer, uint8_t type, uint8_t version, const Bytes& body) {
    if (body.size() > MAX_FRAMED_BODY) {
        throw std::length_error(fmt::format("Payload type {} is {} bytes, limit is 255", type, body.size()));
    }
    writer.u8(type);
    writer.u8(version);
    writer.u8(static_cast<uint8_t>(body.size()));
    writer.bytes(body);
}

} // namespace

void encodeLocation(ByteWriter& writer, const Location& location) {
    std::visit(overloaded{
        [&writer](const GnssLocation& gnss) {
            writer.u8(static_cast<uint8_t>(LocationType::GNSS));
            writer.f32(gnss.latitude);
            writer.f32(gnss.longitude);
        },
        [&writer](const CellLocation& cell) {
            writer.u8(static_cast<uint8_t>(LocationType::Cell));
            writer.varString(cell.mcc);
            writer.varString(cell.mnc);
            writer.varString(cell.lac);
            writer.varString(cell.cellId);
            writer.i8(cell.rssi);
        }
    }, location);
}

void encodeSensor(ByteWriter& writer, const SensorReading& reading) {
    ByteWriter body;
    SensorType type = std::visit(overloaded{
        [](const SensorNull&) {
            return SensorType::Null;
        },
        [&body](const SensorBasic& basic) {
            body.i16(scaleTenths(basic.temperature));
            body.i16(scaleTenths(basic.humidity));
            body.u8(basic.battery);
            body.u8(basic.rssi);
            return SensorType::Basic;
        },
        [&body](const SensorMulti& multi) {
            if (multi.records.size() > MAX_SENSOR_RECORDS) {
                throw std::length_error(fmt::format("{} sensor records exceed the limit of {}",
                    multi.records.size(), MAX_SENSOR_RECORDS));
            }
            body.u8(multi.battery);
            body.u8(multi.rssi);
            body.u32(multi.firstReading);
            body.u16(multi.interval);
            body.u8(static_cast<uint8_t>(multi.records.size()));
            for (const auto& record : multi.records) {
                body.i16(scaleTenths(record.temperature));
                body.i16(scaleTenths(record.humidity));
            }
            return SensorType::Multi;
        },
        [&body](const SensorMotion& motion) {
            body.u8(motion.battery);
            body.u8(motion.rssi);
            body.u32(motion.windowStart);
            body.u16(motion.windowSeconds);
            body.u32(motion.steps);
            return SensorType::MotionSummary;
        }
    }, reading);

    writeFramed(writer, static_cast<uint8_t>(type), SENSOR_VERSION, body.data());
}

std::size_t KeyValue::encodedSize() const {
    std::size_t size = 1;
    for (const auto& [key, value] : entries) {
        size += 1 + std::min(key.size(), MAX_VAR_STRING);
        size += 1 + std::min(value.size(), MAX_VAR_STRING);
    }
    return size;
}

void encodeKeyValue(ByteWriter& writer, const KeyValue& kv) {
    if (kv.entries.size() > 0xFF) {
        throw std::length_error(fmt::format("{} key/value entries exceed the limit of 255", kv.entries.size()));
    }
    ByteWriter body;
    body.u8(static_cast<uint8_t>(kv.entries.size()));
    for (const auto& [key, value] : kv.entries) {
        body.varString(key);
        body.varString(value);
    }
    writeFramed(writer, static_cast<uint8_t>(KeyValueType::Pairs), KEY_VALUE_VERSION, body.data());
}

void encodePayload(ByteWriter& writer, const PayloadVariant& payload) {
    std::visit(overloaded{
        [&writer](const Location& location) { encodeLocation(writer, location); },
        [&writer](const SensorReading& reading) { encodeSensor(writer, reading); },
        [&writer](const KeyValue& kv) { encodeKeyValue(writer, kv); }
    }, payload);
}

///// Decoding /////

Location decodeLocation(ByteReader& reader) {
    uint8_t type = reader.u8();
    switch (static_cast<LocationType>(type)) {
        case LocationType::GNSS: {
            GnssLocation gnss;
            gnss.latitude = reader.f32();
            gnss.longitude = reader.f32();
            return gnss;
        }
        case LocationType::Cell: {
            CellLocation cell;
            cell.mcc = reader.varString();
            cell.mnc = reader.varString();
            cell.lac = reader.varString();
            cell.cellId = reader.varString();
            cell.rssi = reader.i8();
            return cell;
        }
    }
    // Location carries no length prefix, so an unknown type cannot be skipped
    throw DecodeError(fmt::format("Unknown location type {}", type));
}

std::optional<SensorReading> decodeSensor(ByteReader& reader) {
    uint8_t type = reader.u8();
    uint8_t version = reader.u8();
    uint8_t length = reader.u8();
    ByteReader body = reader.slice(length);

    if (version != SENSOR_VERSION) {
        spdlog::debug("Skipping sensor type {} with unsupported version {}", type, version);
        return std::nullopt;
    }

    switch (static_cast<SensorType>(type)) {
        case SensorType::Null:
            return SensorNull{};
        case SensorType::Basic: {
            SensorBasic basic;
            basic.temperature = unscaleTenths(body.i16());
            basic.humidity = unscaleTenths(body.i16());
            basic.battery = body.u8();
            basic.rssi = body.u8();
            return basic;
        }
        case SensorType::Multi: {
            SensorMulti multi;
            multi.battery = body.u8();
            multi.rssi = body.u8();
            multi.firstReading = body.u32();
            multi.interval = body.u16();
            uint8_t count = body.u8();
            multi.records.reserve(count);
            for (uint8_t i = 0; i < count; ++i) {
                SensorRecord record;
                record.temperature = unscaleTenths(body.i16());
                record.humidity = unscaleTenths(body.i16());
                multi.records.push_back(record);
            }
            return multi;
        }
        case SensorType::MotionSummary: {
            SensorMotion motion;
            motion.battery = body.u8();
            motion.rssi = body.u8();
            motion.windowStart = body.u32();
            motion.windowSeconds = body.u16();
            motion.steps = body.u32();
            return motion;
        }
    }

    spdlog::debug("Skipping unknown sensor type {} ({} bytes)", type, length);
    return std::nullopt;
}

KeyValue decodeKeyValue(ByteReader& reader) {
    uint8_t type = reader.u8();
    uint8_t version = reader.u8();
    uint8_t length = reader.u8();
    ByteReader body = reader.slice(length);

    if (type != static_cast<uint8_t>(KeyValueType::Pairs)) {
        throw DecodeError(fmt::format("Unexpected key/value type {}", type));
    }
    if (version != KEY_VALUE_VERSION) {
        throw DecodeError(fmt::format("Unsupported key/value version {}", version));
    }

    KeyValue kv;
    uint8_t count = body.u8();
    for (uint8_t i = 0; i < count; ++i) {
        auto key = body.varString();
        auto value = body.varString();
        kv.add(std::move(key), std::move(value));
    }
    return kv;
}

///// Descriptions /////

std::string describe(const Location& location) {
    return std::visit(overloaded{
        [](const GnssLocation& gnss) {
            return fmt::format("GNSS(lat={:.6f}, lon={:.6f})", gnss.latitude, gnss.longitude);
        },
        [](const CellLocation& cell) {
            return fmt::format("CELL(mcc={}, mnc={}, lac={}, cell_id={}, rssi={})",
                cell.mcc, cell.mnc, cell.lac, cell.cellId, cell.rssi);
        }
    }, location);
}

std::string describe(const SensorReading& reading) {
    return std::visit(overloaded{
        [](const SensorNull&) {
            return std::string("SensorNull");
        },
        [](const SensorBasic& basic) {
            return fmt::format("Sensor(temp={:.1f}C, hum={:.1f}%, batt={}%, rssi={})",
                basic.temperature, basic.humidity, basic.battery, basic.rssi);
        },
        [](const SensorMulti& multi) {
            return fmt::format("SensorMulti(batt={}%, rssi={}, first_ts={}, interval={}s, records={})",
                multi.battery, multi.rssi, multi.firstReading, multi.interval, multi.records.size());
        },
        [](const SensorMotion& motion) {
            return fmt::format("Motion(batt={}%, rssi={}, start={}, window={}s, steps={})",
                motion.battery, motion.rssi, motion.windowStart, motion.windowSeconds, motion.steps);
        }
    }, reading);
}

std::string describe(const KeyValue& kv) {
    std::string out = "{";
    for (std::size_t i = 0; i < kv.entries.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += fmt::format("{}={}", kv.entries[i].first, kv.entries[i].second);
    }
    out += "}";
    return out;
}

} // namespace celltrack
