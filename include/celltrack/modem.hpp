/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __CELLTRACK_MODEM_HPP
#define __CELLTRACK_MODEM_HPP

#include <celltrack/at.hpp>
#include <celltrack/codec.hpp>
#include <celltrack/payload.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace celltrack {

constexpr int SOCKET_ID = 1;
constexpr int SOCKET_RECEIVE_MAX = 1500;
constexpr uint8_t RSSI_UNKNOWN = 0xFF;

struct ServerAddress {
    std::string host;
    uint16_t port = 0;
};

/** Parse "<host>:<port>"; std::nullopt when malformed */
std::optional<ServerAddress> parseServerAddress(std::string_view address);

struct NetworkInfo {
    std::string operatorCode;
    std::string mcc;
    std::string mnc;
    std::string rat = "unknown";
};

/**
 * Murata 1SC modem operations on top of the AT terminal: start-up queries,
 * network attach and the UDP socket used to reach the collector.
 */
class Modem {
public:
    explicit Modem(AtTerminal& terminal) : terminal_(terminal) {}

    AtTerminal& terminal() { return terminal_; }

    /** Echo off, verbose errors, and the packet data APN when one is given */
    void initialize(const std::optional<std::string>& apn);

    std::optional<std::string> readImei();
    std::optional<std::string> readIccid();
    std::optional<std::string> readFirmwareVersion();

    /**
     * Enable automatic operator selection and poll AT+COPS? until the
     * modem reports an operator. Returns std::nullopt if `stop` is set first.
     */
    std::optional<NetworkInfo> waitForNetwork(const std::atomic<bool>& stop,
        std::chrono::milliseconds pollInterval = std::chrono::seconds(2));

    /** Replace socket 1 with a UDP socket to `server` and activate it */
    bool openSocket(const ServerAddress& server);

    bool sendPacket(const Bytes& packet);

    /** Read one datagram from the socket, std::nullopt if none or unreadable */
    std::optional<Bytes> receivePacket();

    /** Signal strength from AT+CSQ, RSSI_UNKNOWN when unavailable */
    uint8_t readRssi();

    /** Serving cell identity and RSSI from AT%MEAS */
    std::optional<CellLocation> readServingCell();

    /** Radio access technology name for an AT+COPS access technology code */
    static std::string ratName(std::string_view code);

private:
    AtTerminal& terminal_;
};

} // namespace celltrack

#endif
