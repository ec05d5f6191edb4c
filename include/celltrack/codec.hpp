/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __CELLTRACK_CODEC_HPP
#define __CELLTRACK_CODEC_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace celltrack {

using Bytes = std::vector<uint8_t>;

constexpr uint8_t PROTOCOL_VERSION = 1;
constexpr std::size_t DEVICE_ID_BYTES = 8;
constexpr std::size_t DEVICE_ID_MAX_DIGITS = DEVICE_ID_BYTES * 2;
constexpr std::size_t HEADER_SIZE = 5 + DEVICE_ID_BYTES;
constexpr std::size_t SERVER_HEADER_SIZE = 5;
constexpr std::size_t MAX_VAR_STRING = 255;

/**
 * Thrown when an inbound buffer is too short for a declared field or
 * contains values that cannot be decoded.
 */
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Appends big-endian fields to a byte buffer.
 */
class ByteWriter {
public:
    ByteWriter() = default;

    void u8(uint8_t value);
    void i8(int8_t value);
    void u16(uint16_t value);
    void i16(int16_t value);
    void u32(uint32_t value);
    void f32(float value);

    /** One length byte followed by the ASCII bytes; inputs over 255 bytes are truncated. */
    void varString(std::string_view value);

    void bytes(const uint8_t* data, std::size_t length);
    void bytes(const Bytes& data) { bytes(data.data(), data.size()); }

    const Bytes& data() const { return buffer_; }
    Bytes take() { return std::move(buffer_); }
    std::size_t size() const { return buffer_.size(); }

private:
    Bytes buffer_;
};

/**
 * Sequentially reads big-endian fields from a byte buffer.
 * Every read checks the remaining length and throws DecodeError when the
 * buffer is short.
 */
class ByteReader {
public:
    ByteReader(const uint8_t* data, std::size_t length) : data_(data), length_(length) {}
    explicit ByteReader(const Bytes& data) : ByteReader(data.data(), data.size()) {}

    uint8_t u8();
    int8_t i8();
    uint16_t u16();
    int16_t i16();
    uint32_t u32();
    float f32();
    std::string varString();

    /** Returns the next `length` bytes as a sub-reader and advances past them */
    ByteReader slice(std::size_t length);

    void skip(std::size_t length);

    std::size_t remaining() const { return length_ - position_; }
    std::size_t position() const { return position_; }
    bool empty() const { return remaining() == 0; }

    /** Copies everything not yet read */
    Bytes rest() const;

private:
    const uint8_t* data_;
    std::size_t length_;
    std::size_t position_ = 0;

    void require(std::size_t count, const char* what) const;
};

/**
 * Two character packet command code. A single character is padded with a
 * NUL byte, longer input is truncated and empty input becomes two NULs.
 */
struct Command {
    std::array<char, 2> code{'\0', '\0'};

    Command() = default;
    Command(std::string_view text);
    Command(char c0, char c1) : code{c0, c1} {}

    char first() const { return code[0]; }
    char second() const { return code[1]; }

    /** Printable form, NUL rendered as "\0" */
    std::string toString() const;

    bool operator==(const Command& other) const = default;
};

struct PacketHeader {
    uint8_t version = PROTOCOL_VERSION;
    Command command;
    uint16_t transactionId = 0;
    std::string deviceId;
};

struct DecodedPacket {
    PacketHeader header;
    Bytes payload;
};

/** Packs the digits of a device identifier two per byte, high nibble first */
std::array<uint8_t, DEVICE_ID_BYTES> packDeviceId(std::string_view deviceId);

/**
 * Unpacks a packed-decimal identifier, dropping trailing zero padding bytes.
 *
 * Padding cannot be told apart from "00" digit pairs, so an identifier
 * ending in "00" comes back shorter: "358419511056300" packs to
 * 03 58 41 95 11 05 63 00 and unpacks as "03584195110563".
 */
std::string unpackDeviceId(const uint8_t* data, std::size_t length = DEVICE_ID_BYTES);

/** The canonical form of a device identifier after a pack/unpack round trip */
std::string normalizeDeviceId(std::string_view deviceId);

/** Writes the 13 byte device header: version, command, transaction id, device id */
void encodeHeader(ByteWriter& writer, const PacketHeader& header);

/** Decodes a packet carrying the full device header */
DecodedPacket decodeHeader(const Bytes& packet);

/** Decodes a collector packet carrying the short header (version, command, transaction id) */
DecodedPacket decodeServerHeader(const Bytes& packet);

std::string toHex(const Bytes& data);
Bytes fromHex(std::string_view hex);

} // namespace celltrack

#endif
