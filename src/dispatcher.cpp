/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <celltrack/dispatcher.hpp>
#include <celltrack/packets.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/bin_to_hex.h>

#include <algorithm>
#include <charconv>
#include <stdexcept>

using spdlog::debug;
using spdlog::info;
using spdlog::warn;
using spdlog::error;

namespace celltrack {

InboundDispatcher::~InboundDispatcher() {
    stop();
}

void InboundDispatcher::start() {
    stopping_ = false;
    thread_ = std::thread([this] { run(); });
}

void InboundDispatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(tasksMutex_);
        stopping_ = true;
    }
    tasksCV_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }

    std::vector<FirmwareTask> tasks;
    {
        std::lock_guard<std::mutex> lock(tasksMutex_);
        tasks.swap(tasks_);
    }
    for (auto& task : tasks) {
        if (task.thread.joinable()) {
            task.thread.join();
        }
    }
}

void InboundDispatcher::run() {
    info("Inbound dispatcher started.");
    auto& terminal = modem_.terminal();
    while (!stopping_ && !terminal.events().isClosed()) {
        auto event = terminal.waitForEvent(EVENT_TIMEOUT);
        if (event.has_value()) {
            handleEvent(*event);
        }
    }
    info("Inbound dispatcher stopped.");
}

void InboundDispatcher::handleEvent(const AtEvent& event) {
    if (event.tag != SOCKET_EVENT) {
        debug("Ignoring event %{}: {}", event.tag, event.payload);
        return;
    }

    auto packet = modem_.receivePacket();
    if (!packet.has_value()) {
        return;
    }
    handlePacket(*packet);
}

void InboundDispatcher::handlePacket(const Bytes& packet) {
    DecodedPacket decoded;
    try {
        decoded = decodeServerHeader(packet);
    } catch (const DecodeError& e) {
        warn("Dropping undecodable packet {}: {}", toHex(packet), e.what());
        return;
    }

    const auto& header = decoded.header;
    debug("Inbound packet bytes:{}", spdlog::to_hex(packet));
    info("Received packet [{}] txn={} version={} payload={}",
        header.command.toString(), header.transactionId, header.version, toHex(decoded.payload));

    try {
        route(header, decoded.payload);
    } catch (const std::length_error& e) {
        error("Could not encode reply to [{}] txn={}: {}", header.command.toString(), header.transactionId, e.what());
    }
}

void InboundDispatcher::route(const PacketHeader& header, const Bytes& payload) {
    switch (header.command.first()) {
        case INBOUND_ACK:
            debug("Acknowledgment for transaction {}", header.transactionId);
            correlator_.resolve(header.transactionId);
            break;
        case INBOUND_CONFIG_READ:
            sendConfigReply(header.transactionId, "Requested Configuration");
            break;
        case INBOUND_CONFIG_WRITE:
            handleConfigWrite(header.transactionId, payload);
            break;
        case INBOUND_FIRMWARE:
            handleFirmwareRequest(header.transactionId, payload);
            break;
        default:
            warn("Ignoring unsupported command [{}] txn={} payload={}",
                header.command.toString(), header.transactionId, toHex(payload));
            break;
    }
}

void InboundDispatcher::sendConfigReply(uint16_t transactionId, const char* reason) {
    auto settings = settings_.snapshot();
    auto packet = makeConfigPacket(deviceId_, transactionId, *settings);
    auto bytes = packet.encode();
    info("Sending {}: {} ({} bytes)", reason, packet.describe(), bytes.size());
    // A reply is not acknowledged
    modem_.sendPacket(bytes);
}

void InboundDispatcher::handleConfigWrite(uint16_t transactionId, const Bytes& payload) {
    auto current = settings_.snapshot();
    try {
        ByteReader reader(payload);
        auto update = decodeKeyValue(reader);
        auto next = applyKeyValue(*current, update);
        settings_.replace(next);
        info("Configuration updated: server={}, interval={}s, readings={}s, motion={}s",
            next.serverAddress, next.reportingInterval, next.readingInterval, next.motionInterval);
    } catch (const DecodeError& e) {
        warn("Rejected configuration write txn={} payload={}: {}", transactionId, toHex(payload), e.what());
    } catch (const std::invalid_argument& e) {
        warn("Rejected configuration write txn={} payload={}: {}", transactionId, toHex(payload), e.what());
    }
    sendConfigReply(transactionId, "Configuration Updated");
}

void InboundDispatcher::handleFirmwareRequest(uint16_t transactionId, const Bytes& payload) {
    std::string version;
    std::chrono::seconds duration = DEFAULT_FIRMWARE_UPDATE_TIME;
    try {
        ByteReader reader(payload);
        auto request = decodeKeyValue(reader);
        auto requested = request.get("version");
        if (!requested.has_value() || requested->empty()) {
            throw DecodeError("Firmware request has no version");
        }
        KeyValue reply;
        reply.add("version", *requested);
        reply.add("status", FIRMWARE_COMPLETE);
        if (reply.encodedSize() > MAX_FRAMED_BODY) {
            throw DecodeError(fmt::format("Firmware version of {} bytes is too long", requested->size()));
        }
        version = *requested;
        if (auto seconds = request.get("seconds")) {
            int value = 0;
            auto result = std::from_chars(seconds->data(), seconds->data() + seconds->size(), value);
            if (result.ec != std::errc{} || value < 0) {
                throw DecodeError(fmt::format("Invalid firmware update time '{}'", *seconds));
            }
            duration = std::min(std::chrono::seconds(value), MAX_FIRMWARE_UPDATE_TIME);
        }
    } catch (const DecodeError& e) {
        warn("Rejected firmware request txn={} payload={}: {}", transactionId, toHex(payload), e.what());
        modem_.sendPacket(makeFirmwarePacket(deviceId_, transactionId, version, FIRMWARE_REJECTED).encode());
        return;
    }

    info("Firmware update to {} requested, simulating {}s download", version, duration.count());
    modem_.sendPacket(makeFirmwarePacket(deviceId_, transactionId, version, FIRMWARE_ACCEPTED).encode());

    std::lock_guard<std::mutex> lock(tasksMutex_);
    reapFinishedTasks();
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread thread([this, version, duration, done] {
        runFirmwareUpdate(version, duration);
        *done = true;
    });
    tasks_.push_back(FirmwareTask{std::move(thread), std::move(done)});
}

void InboundDispatcher::reapFinishedTasks() {
    auto finished = std::partition(tasks_.begin(), tasks_.end(),
        [](const FirmwareTask& task) { return !task.done->load(); });
    for (auto it = finished; it != tasks_.end(); ++it) {
        it->thread.join();
    }
    tasks_.erase(finished, tasks_.end());
}

std::size_t InboundDispatcher::pendingFirmwareUpdates() {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    reapFinishedTasks();
    return tasks_.size();
}

void InboundDispatcher::runFirmwareUpdate(std::string version, std::chrono::seconds duration) {
    {
        std::unique_lock<std::mutex> lock(tasksMutex_);
        if (tasksCV_.wait_for(lock, duration, [this] { return stopping_.load(); })) {
            warn("Firmware update to {} abandoned", version);
            return;
        }
    }

    auto transactionId = correlator_.nextId();
    auto packet = makeFirmwarePacket(deviceId_, transactionId, version, FIRMWARE_COMPLETE);
    info("Sending Firmware Status: {}", packet.describe());
    if (!modem_.sendPacket(packet.encode())) {
        error("Failed to report firmware update to {}", version);
        return;
    }
    auto deadline = std::chrono::steady_clock::now() + ACK_TIMEOUT;
    while (!stopping_ && std::chrono::steady_clock::now() < deadline) {
        if (correlator_.awaitAck(transactionId, ACK_POLL_INTERVAL)) {
            debug("Firmware status txn={} acknowledged", transactionId);
            return;
        }
    }
    warn("No acknowledgment for firmware status txn={}", transactionId);
}

} // namespace celltrack
