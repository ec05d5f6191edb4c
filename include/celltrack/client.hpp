/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __CELLTRACK_CLIENT_HPP
#define __CELLTRACK_CLIENT_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <asio.hpp>
#include <celltrack/at.hpp>
#include <celltrack/config.hpp>
#include <celltrack/dispatcher.hpp>
#include <celltrack/modem.hpp>
#include <celltrack/packets.hpp>
#include <celltrack/sensors.hpp>
#include <celltrack/serialport.hpp>
#include <celltrack/settings.hpp>
#include <celltrack/transactions.hpp>

namespace celltrack {

constexpr const char* CELLTRACK_VERSION = "1.0.0";

// The current status of the client
enum class ClientStatus {
    STOPPED,
    STARTING,
    RUNNING,
    STOPPING
};

/**
 * The tracker service. Owns the modem port and its I/O thread, the inbound
 * dispatcher and the telemetry and motion producers.
 *
 * stop() only requests shutdown and is safe from any thread, including
 * signal handlers; wait() blocks until shutdown is requested and then
 * tears everything down.
 */
class Client {
public:
    Client(Config config);
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    ClientStatus status();

    /**
     * Open the modem, register on the network, open the collector socket,
     * announce the device and start the producers.
     * Returns false if the serial port cannot be opened, the network never
     * attaches, or the server address is malformed.
     */
    bool start();
    void stop();
    void wait();

private:
    Config config;
    std::atomic<ClientStatus> _status = ClientStatus::STOPPED;
    std::atomic<bool> stopping = false;
    std::once_flag shutdownOnce;

    asio::io_context io;
    asio::signal_set signals{io, SIGINT, SIGTERM};
    std::thread ioThread;

    AtTerminal terminal;
    Modem modem{terminal};
    TransactionCorrelator correlator;
    SettingsStore settings;
    Sensors sensors;
    std::unique_ptr<ModemSerialPort> serialPort;
    std::unique_ptr<InboundDispatcher> dispatcher;

    std::string deviceId;
    PowerOnInfo powerOnInfo;

    std::thread telemetryThread;
    std::thread motionThread;
    std::mutex sleepMutex;
    std::condition_variable sleepCV;

    void initSignals();
    void shutdown();

    /** Sleep unless stopped first. Returns false when stopping. */
    bool sleepFor(std::chrono::seconds duration);

    /** Send a packet and wait for the collector to acknowledge it */
    bool sendAndAwait(const Packet& packet, const char* name);

    Location readLocation();
    void telemetryLoop();
    void motionLoop();
};

}

#endif
