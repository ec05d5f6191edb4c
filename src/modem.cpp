/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <celltrack/modem.hpp>
#include <spdlog/spdlog.h>

#include <charconv>
#include <thread>

using spdlog::debug;
using spdlog::info;
using spdlog::warn;
using spdlog::error;

namespace celltrack {

namespace {

std::optional<int> parseInt(std::string_view field) {
    if (field.empty()) {
        return std::nullopt;
    }
    int value = 0;
    auto result = std::from_chars(field.data(), field.data() + field.size(), value);
    if (result.ec != std::errc{} || result.ptr != field.data() + field.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::string> dataOf(const AtResponse& rsp) {
    if (rsp.success && rsp.hasData()) {
        return rsp.data();
    }
    return std::nullopt;
}

} // namespace

std::optional<ServerAddress> parseServerAddress(std::string_view address) {
    auto colon = address.rfind(':');
    if (colon == std::string_view::npos || colon == 0) {
        return std::nullopt;
    }
    auto port = parseInt(address.substr(colon + 1));
    if (!port || *port <= 0 || *port > 65535) {
        return std::nullopt;
    }
    return ServerAddress{std::string(address.substr(0, colon)), static_cast<uint16_t>(*port)};
}

void Modem::initialize(const std::optional<std::string>& apn) {
    terminal_.sendCommand("ATE0");
    terminal_.sendCommand("AT+CMEE=2");
    if (apn.has_value() && !apn->empty()) {
        info("Setting APN: {}", *apn);
        auto rsp = terminal_.sendCommand(fmt::format("AT+CGDCONT=1,\"IP\",\"{}\"", *apn));
        if (!rsp.success) {
            warn("Failed to set APN {}", *apn);
        }
    }
}

std::optional<std::string> Modem::readImei() {
    return dataOf(terminal_.sendCommand("AT+CGSN"));
}

std::optional<std::string> Modem::readIccid() {
    return dataOf(terminal_.sendCommand("AT%CCID"));
}

std::optional<std::string> Modem::readFirmwareVersion() {
    return dataOf(terminal_.sendCommand("AT+CGMR"));
}

std::optional<NetworkInfo> Modem::waitForNetwork(const std::atomic<bool>& stop, std::chrono::milliseconds pollInterval) {
    terminal_.sendCommand("AT+COPS=0");
    terminal_.sendCommand("AT+COPS=3,2");

    while (!stop) {
        auto rsp = terminal_.sendCommand("AT+COPS?");
        if (rsp.success && rsp.fields.size() > 2) {
            NetworkInfo network;
            network.operatorCode = rsp.fields[2];
            network.mcc = network.operatorCode.substr(0, 3);
            network.mnc = network.operatorCode.size() > 3 ? network.operatorCode.substr(3, 3) : "";
            if (rsp.fields.size() > 3) {
                network.rat = ratName(rsp.fields[3]);
            }
            info("Network: {} ({})", network.operatorCode, network.rat);
            return network;
        }
        info("Waiting for network...");
        std::this_thread::sleep_for(pollInterval);
    }
    return std::nullopt;
}

bool Modem::openSocket(const ServerAddress& server) {
    terminal_.sendCommand(fmt::format("AT%SOCKETCMD=\"DELETE\",{}", SOCKET_ID));
    auto rsp = terminal_.sendCommand(fmt::format("AT%SOCKETCMD=\"ALLOCATE\",{},\"UDP\",\"OPEN\",\"{}\",{},5000",
        SOCKET_ID, server.host, server.port));
    if (!rsp.success) {
        error("Failed to allocate socket to {}:{}", server.host, server.port);
        return false;
    }
    rsp = terminal_.sendCommand(fmt::format("AT%SOCKETCMD=\"ACTIVATE\",{}", SOCKET_ID));
    if (!rsp.success) {
        error("Failed to activate socket to {}:{}", server.host, server.port);
        return false;
    }
    info("Socket {} open to {}:{}", SOCKET_ID, server.host, server.port);
    return true;
}

bool Modem::sendPacket(const Bytes& packet) {
    auto rsp = terminal_.sendCommand(fmt::format("AT%SOCKETDATA=\"SEND\",{},{},\"{}\"",
        SOCKET_ID, packet.size(), toHex(packet)));
    if (!rsp.success) {
        warn("Failed to send {} byte packet: {}", packet.size(), toHex(packet));
    }
    return rsp.success;
}

std::optional<Bytes> Modem::receivePacket() {
    auto rsp = terminal_.sendCommand(fmt::format("AT%SOCKETDATA=\"RECEIVE\",{},{}", SOCKET_ID, SOCKET_RECEIVE_MAX));
    if (!rsp.success || !rsp.hasData()) {
        warn("Socket receive returned no data");
        return std::nullopt;
    }
    // <socket>,<requested>,<actual>,"<hex>","<host>",<port>
    if (rsp.fields.size() < 4) {
        warn("Could not extract packet from socket data '{}'", rsp.data());
        return std::nullopt;
    }
    const auto& hex = rsp.fields[3];
    if (hex.empty()) {
        return std::nullopt;
    }
    try {
        return fromHex(hex);
    } catch (const DecodeError& e) {
        warn("Invalid packet hex '{}': {}", hex, e.what());
        return std::nullopt;
    }
}

uint8_t Modem::readRssi() {
    auto rsp = terminal_.sendCommand("AT+CSQ");
    if (!rsp.success) {
        return RSSI_UNKNOWN;
    }
    auto rssi = parseInt(rsp.field(0));
    if (!rssi || *rssi < 0 || *rssi > 0xFF) {
        return RSSI_UNKNOWN;
    }
    return static_cast<uint8_t>(*rssi);
}

std::optional<CellLocation> Modem::readServingCell() {
    auto rsp = terminal_.sendCommand("AT%MEAS=\"95\"");
    if (!rsp.success || rsp.fields.size() < 10) {
        warn("Error reading serving cell: {}", rsp.data());
        return std::nullopt;
    }
    CellLocation cell;
    cell.cellId = rsp.fields[0];
    if (cell.cellId.starts_with("ECID:")) {
        cell.cellId.erase(0, 5);
    }
    cell.mcc = rsp.fields[3];
    cell.mnc = rsp.fields[4];
    cell.lac = rsp.fields[5];
    auto rssi = parseInt(rsp.fields[9]);
    if (!rssi || *rssi < -128 || *rssi > 127) {
        warn("Invalid serving cell RSSI '{}'", rsp.fields[9]);
        return std::nullopt;
    }
    cell.rssi = static_cast<int8_t>(*rssi);
    return cell;
}

std::string Modem::ratName(std::string_view code) {
    if (code == "0") return "GSM";
    if (code == "2") return "UTRAN";
    if (code == "7") return "LTE-M";
    if (code == "9") return "NB-IoT";
    return fmt::format("unknown-{}", code);
}

} // namespace celltrack
