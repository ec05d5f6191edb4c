/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <celltrack/codec.hpp>
#include <spdlog/spdlog.h>

#include <bit>
#include <cctype>
#include <charconv>

namespace celltrack {

///// ByteWriter Implementation /////

void ByteWriter::u8(uint8_t value) {
    buffer_.push_back(value);
}

void ByteWriter::i8(int8_t value) {
    buffer_.push_back(static_cast<uint8_t>(value));
}

void ByteWriter::u16(uint16_t value) {
    buffer_.push_back(static_cast<uint8_t>(value >> 8));
    buffer_.push_back(static_cast<uint8_t>(value));
}

void ByteWriter::i16(int16_t value) {
    u16(static_cast<uint16_t>(value));
}

void ByteWriter::u32(uint32_t value) {
    buffer_.push_back(static_cast<uint8_t>(value >> 24));
    buffer_.push_back(static_cast<uint8_t>(value >> 16));
    buffer_.push_back(static_cast<uint8_t>(value >> 8));
    buffer_.push_back(static_cast<uint8_t>(value));
}

void ByteWriter::f32(float value) {
    u32(std::bit_cast<uint32_t>(value));
}

void ByteWriter::varString(std::string_view value) {
    if (value.size() > MAX_VAR_STRING) {
        value = value.substr(0, MAX_VAR_STRING);
    }
    u8(static_cast<uint8_t>(value.size()));
    buffer_.insert(buffer_.end(), value.begin(), value.end());
}

void ByteWriter::bytes(const uint8_t* data, std::size_t length) {
    buffer_.insert(buffer_.end(), data, data + length);
}

///// ByteReader Implementation /////

void ByteReader::require(std::size_t count, const char* what) const {
    if (remaining() < count) {
        throw DecodeError(fmt::format("Not enough data to read {}: need {} bytes, {} remaining",
            what, count, remaining()));
    }
}

uint8_t ByteReader::u8() {
    require(1, "uint8");
    return data_[position_++];
}

int8_t ByteReader::i8() {
    return static_cast<int8_t>(u8());
}

uint16_t ByteReader::u16() {
    require(2, "uint16");
    uint16_t value = static_cast<uint16_t>((data_[position_] << 8) | data_[position_ + 1]);
    position_ += 2;
    return value;
}

int16_t ByteReader::i16() {
    return static_cast<int16_t>(u16());
}

uint32_t ByteReader::u32() {
    require(4, "uint32");
    uint32_t value = (static_cast<uint32_t>(data_[position_]) << 24) |
                     (static_cast<uint32_t>(data_[position_ + 1]) << 16) |
                     (static_cast<uint32_t>(data_[position_ + 2]) << 8) |
                     static_cast<uint32_t>(data_[position_ + 3]);
    position_ += 4;
    return value;
}

float ByteReader::f32() {
    return std::bit_cast<float>(u32());
}

std::string ByteReader::varString() {
    std::size_t length = u8();
    require(length, "string");
    std::string value(reinterpret_cast<const char*>(data_ + position_), length);
    position_ += length;
    return value;
}

ByteReader ByteReader::slice(std::size_t length) {
    require(length, "field");
    ByteReader sub(data_ + position_, length);
    position_ += length;
    return sub;
}

void ByteReader::skip(std::size_t length) {
    require(length, "skipped field");
    position_ += length;
}

Bytes ByteReader::rest() const {
    return Bytes(data_ + position_, data_ + length_);
}

///// Command Implementation /////

Command::Command(std::string_view text) {
    if (text.size() >= 1) {
        code[0] = text[0];
    }
    if (text.size() >= 2) {
        code[1] = text[1];
    }
}

std::string Command::toString() const {
    std::string out;
    for (char c : code) {
        if (c == '\0') {
            out += "\\0";
        } else {
            out += c;
        }
    }
    return out;
}

///// Device identifier /////

std::array<uint8_t, DEVICE_ID_BYTES> packDeviceId(std::string_view deviceId) {
    std::string digits;
    for (char c : deviceId) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits += c;
        }
    }
    if (digits.size() % 2 != 0) {
        digits.insert(digits.begin(), '0');
    }
    if (digits.size() > DEVICE_ID_MAX_DIGITS) {
        digits.resize(DEVICE_ID_MAX_DIGITS);
    }

    std::array<uint8_t, DEVICE_ID_BYTES> packed{};
    for (std::size_t i = 0; i + 1 < digits.size(); i += 2) {
        uint8_t high = static_cast<uint8_t>(digits[i] - '0');
        uint8_t low = static_cast<uint8_t>(digits[i + 1] - '0');
        packed[i / 2] = static_cast<uint8_t>((high << 4) | low);
    }
    return packed;
}

std::string unpackDeviceId(const uint8_t* data, std::size_t length) {
    // Trailing zero bytes are padding
    while (length > 0 && data[length - 1] == 0) {
        --length;
    }

    std::string digits;
    digits.reserve(length * 2);
    for (std::size_t i = 0; i < length; ++i) {
        uint8_t high = data[i] >> 4;
        uint8_t low = data[i] & 0x0F;
        if (high > 9 || low > 9) {
            throw DecodeError(fmt::format("Invalid packed-decimal byte 0x{:02x} in device id", data[i]));
        }
        digits += static_cast<char>('0' + high);
        digits += static_cast<char>('0' + low);
    }
    return digits;
}

std::string normalizeDeviceId(std::string_view deviceId) {
    auto packed = packDeviceId(deviceId);
    return unpackDeviceId(packed.data(), packed.size());
}

///// Header /////

void encodeHeader(ByteWriter& writer, const PacketHeader& header) {
    writer.u8(header.version);
    writer.u8(static_cast<uint8_t>(header.command.first()));
    writer.u8(static_cast<uint8_t>(header.command.second()));
    writer.u16(header.transactionId);
    auto packed = packDeviceId(header.deviceId);
    writer.bytes(packed.data(), packed.size());
}

namespace {

PacketHeader readShortHeader(ByteReader& reader) {
    PacketHeader header;
    header.version = reader.u8();
    char c0 = static_cast<char>(reader.u8());
    char c1 = static_cast<char>(reader.u8());
    header.command = Command(c0, c1);
    header.transactionId = reader.u16();
    return header;
}

} // namespace

DecodedPacket decodeHeader(const Bytes& packet) {
    if (packet.size() < HEADER_SIZE) {
        throw DecodeError(fmt::format("Packet too short for header: {} bytes, need {}", packet.size(), HEADER_SIZE));
    }
    ByteReader reader(packet);
    DecodedPacket decoded;
    decoded.header = readShortHeader(reader);
    auto deviceBytes = reader.slice(DEVICE_ID_BYTES).rest();
    decoded.header.deviceId = unpackDeviceId(deviceBytes.data(), deviceBytes.size());
    decoded.payload = reader.rest();
    return decoded;
}

DecodedPacket decodeServerHeader(const Bytes& packet) {
    if (packet.size() < SERVER_HEADER_SIZE) {
        throw DecodeError(fmt::format("Packet too short for header: {} bytes, need {}", packet.size(), SERVER_HEADER_SIZE));
    }
    ByteReader reader(packet);
    DecodedPacket decoded;
    decoded.header = readShortHeader(reader);
    decoded.payload = reader.rest();
    return decoded;
}

///// Hex /////

std::string toHex(const Bytes& data) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (uint8_t b : data) {
        out += digits[b >> 4];
        out += digits[b & 0x0F];
    }
    return out;
}

Bytes fromHex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        throw DecodeError(fmt::format("Hex string has odd length {}", hex.size()));
    }
    Bytes out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        uint8_t value = 0;
        auto result = std::from_chars(hex.data() + i, hex.data() + i + 2, value, 16);
        if (result.ec != std::errc{} || result.ptr != hex.data() + i + 2) {
            throw DecodeError(fmt::format("Invalid hex digits '{}' at offset {}", hex.substr(i, 2), i));
        }
        out.push_back(value);
    }
    return out;
}

} // namespace celltrack
