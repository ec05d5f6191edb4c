/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __CELLTRACK_DISPATCHER_HPP
#define __CELLTRACK_DISPATCHER_HPP

#include <celltrack/codec.hpp>
#include <celltrack/modem.hpp>
#include <celltrack/settings.hpp>
#include <celltrack/transactions.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace celltrack {

/** Modem event announcing data waiting on a socket */
constexpr const char* SOCKET_EVENT = "SOCKETEV";

constexpr std::chrono::seconds DEFAULT_FIRMWARE_UPDATE_TIME{10};
constexpr std::chrono::seconds MAX_FIRMWARE_UPDATE_TIME{600};

constexpr const char* FIRMWARE_ACCEPTED = "accepted";
constexpr const char* FIRMWARE_REJECTED = "rejected";
constexpr const char* FIRMWARE_COMPLETE = "complete";

/**
 * Routes packets sent by the collector.
 *
 * A single thread pops modem events; on a socket event it reads the
 * datagram and handles it by command:
 *   A  resolves the acknowledged transaction
 *   C  replies with the current configuration
 *   W  replaces the configuration, then replies with it
 *   F  starts a simulated firmware update on its own task
 * Anything else is logged and dropped.
 */
class InboundDispatcher {
public:
    InboundDispatcher(Modem& modem, TransactionCorrelator& correlator, SettingsStore& settings, std::string deviceId)
        : modem_(modem), correlator_(correlator), settings_(settings), deviceId_(std::move(deviceId)) {}
    ~InboundDispatcher();

    InboundDispatcher(const InboundDispatcher&) = delete;
    InboundDispatcher& operator=(const InboundDispatcher&) = delete;

    void start();

    /** Stop the dispatch thread and wait for running firmware tasks */
    void stop();

    /** Handle one modem event */
    void handleEvent(const AtEvent& event);

    /** Handle one datagram received from the collector */
    void handlePacket(const Bytes& packet);

    /** Firmware updates still running; finished tasks are joined first */
    std::size_t pendingFirmwareUpdates();

private:
    Modem& modem_;
    TransactionCorrelator& correlator_;
    SettingsStore& settings_;
    std::string deviceId_;

    std::atomic<bool> stopping_ = false;
    std::thread thread_;

    struct FirmwareTask {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    std::mutex tasksMutex_;
    std::condition_variable tasksCV_;
    std::vector<FirmwareTask> tasks_;

    void run();
    void route(const PacketHeader& header, const Bytes& payload);
    void reapFinishedTasks();
    void sendConfigReply(uint16_t transactionId, const char* reason);
    void handleConfigWrite(uint16_t transactionId, const Bytes& payload);
    void handleFirmwareRequest(uint16_t transactionId, const Bytes& payload);
    void runFirmwareUpdate(std::string version, std::chrono::seconds duration);
};

} // namespace celltrack

#endif
