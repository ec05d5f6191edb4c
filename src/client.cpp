/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <celltrack/client.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>

using spdlog::debug;
using spdlog::info;
using spdlog::warn;
using spdlog::error;
using spdlog::critical;

namespace celltrack {

namespace {

uint32_t unixTime() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

uint16_t toWireSeconds(uint32_t seconds) {
    return static_cast<uint16_t>(std::min<uint32_t>(seconds, UINT16_MAX));
}

}

Client::Client(Config c)
    : config(std::move(c)),
      settings(config.deviceSettings()),
      sensors(config.getLatitude(), config.getLongitude()) {}

Client::~Client() {
    stop();
    wait();
    info("Client destroyed.");
}

ClientStatus Client::status() {
    return _status.load();
}

bool Client::start() {
    ClientStatus expected = ClientStatus::STOPPED;
    if (!_status.compare_exchange_strong(expected, ClientStatus::STARTING)) {
        return false;
    }
    info("Starting celltrack {}...", CELLTRACK_VERSION);

    initSignals();

    SerialPortOptions portOptions;
    portOptions.readTerminator = "\r\n";
    portOptions.baudRate = config.getBaud();
    serialPort = std::make_unique<ModemSerialPort>(io, config.getPort(), portOptions, terminal);
    if (!serialPort->start()) {
        critical("Could not open modem serial port {}", config.getPort());
        return false;
    }
    terminal.setWriter([this](const std::string& data) { serialPort->write(data); });

    ioThread = std::thread([this] {
        try {
            io.run();
        } catch (const std::exception& e) {
            critical("Unexpected error on the I/O thread: {}", e.what());
            std::exit(EXIT_FAILURE);
        }
    });

    modem.initialize(config.getApn());

    if (config.hasImei()) {
        deviceId = config.getImei();
    } else {
        auto imei = modem.readImei();
        if (!imei.has_value()) {
            critical("Could not read IMEI from the modem");
            return false;
        }
        deviceId = *imei;
    }
    info("Device ID: {}", deviceId);

    auto iccid = modem.readIccid();
    info("ICCID: {}", iccid.value_or("unknown"));

    auto network = modem.waitForNetwork(stopping);
    if (!network.has_value()) {
        warn("Stopped while waiting for the network");
        return false;
    }

    powerOnInfo.customerCode = config.getCustomerCode();
    powerOnInfo.softwareVersion = CELLTRACK_VERSION;
    powerOnInfo.modemVersion = modem.readFirmwareVersion().value_or("");
    powerOnInfo.mcc = network->mcc;
    powerOnInfo.mnc = network->mnc;
    powerOnInfo.rat = network->rat;
    info("Modem firmware: {}", powerOnInfo.modemVersion);

    auto current = settings.snapshot();
    auto server = parseServerAddress(current->serverAddress);
    if (!server.has_value()) {
        critical("Invalid server address '{}', expected host:port", current->serverAddress);
        return false;
    }
    if (!modem.openSocket(*server)) {
        critical("Could not open socket to {}", current->serverAddress);
        return false;
    }

    dispatcher = std::make_unique<InboundDispatcher>(modem, correlator, settings, deviceId);
    dispatcher->start();

    sendAndAwait(makePowerOnPacket(deviceId, correlator.nextId(), powerOnInfo), "Power On");
    sendAndAwait(makeConfigPacket(deviceId, correlator.nextId(), *settings.snapshot()), "Configuration");

    expected = ClientStatus::STARTING;
    if (!_status.compare_exchange_strong(expected, ClientStatus::RUNNING)) {
        // Stopped during start up
        return true;
    }

    telemetryThread = std::thread([this] { telemetryLoop(); });
    motionThread = std::thread([this] { motionLoop(); });
    info("Client started.");
    return true;
}

void Client::initSignals() {
    signals.async_wait([this](auto ec, int sig) {
        if (ec) {
            error("Error receiving signal: {}", ec.message());
        } else {
            info("Received signal {}.", sig);
        }
        stop();
    });
}

void Client::stop() {
    {
        std::lock_guard<std::mutex> lock(sleepMutex);
        if (stopping.exchange(true)) {
            return;
        }
    }
    if (_status.load() != ClientStatus::STOPPED) {
        _status.store(ClientStatus::STOPPING);
    }
    info("Stopping client...");
    sleepCV.notify_all();  // Wake up producers so they see the status change
    terminal.events().close();
}

void Client::wait() {
    {
        std::unique_lock<std::mutex> lock(sleepMutex);
        sleepCV.wait(lock, [this] { return stopping.load(); });
    }
    std::call_once(shutdownOnce, [this] { shutdown(); });
}

void Client::shutdown() {
    if (telemetryThread.joinable()) {
        info("Waiting for telemetry thread to finish...");
        telemetryThread.join();
    }
    if (motionThread.joinable()) {
        info("Waiting for motion thread to finish...");
        motionThread.join();
    }
    if (dispatcher) {
        dispatcher->stop();
    }
    io.stop();
    if (ioThread.joinable()) {
        info("Waiting for IO thread to finish...");
        ioThread.join();
    }
    if (serialPort) {
        serialPort->close();
    }
    _status.store(ClientStatus::STOPPED);
    info("Client stopped.");
}

bool Client::sleepFor(std::chrono::seconds duration) {
    std::unique_lock<std::mutex> lock(sleepMutex);
    return !sleepCV.wait_for(lock, duration, [this] { return stopping.load(); });
}

bool Client::sendAndAwait(const Packet& packet, const char* name) {
    auto bytes = packet.encode();
    info("Sending {}: {} ({} bytes)", name, packet.describe(), bytes.size());
    if (!modem.sendPacket(bytes)) {
        error("Failed to send {} txn={}", name, packet.header.transactionId);
        return false;
    }

    auto id = packet.header.transactionId;
    auto deadline = std::chrono::steady_clock::now() + ACK_TIMEOUT;
    while (!stopping) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }
        if (correlator.awaitAck(id, std::min<std::chrono::milliseconds>(remaining, ACK_POLL_INTERVAL))) {
            debug("{} txn={} acknowledged", name, id);
            return true;
        }
    }
    warn("No acknowledgment for {} txn={}", name, id);
    return false;
}

Location Client::readLocation() {
    if (config.getLocationMode() == LocationMode::CELL) {
        auto cell = modem.readServingCell();
        if (cell.has_value()) {
            return *cell;
        }
        warn("Serving cell unavailable, reporting simulated location");
    }
    return sensors.readLocation();
}

void Client::telemetryLoop() {
    info("Telemetry started.");
    while (!stopping) {
        auto current = settings.snapshot();
        auto id = correlator.nextId();

        uint32_t interval = current->reportingInterval;
        uint32_t readings = std::max<uint32_t>(1, current->readingInterval);
        std::size_t records = std::clamp<std::size_t>(interval / readings, 1, MAX_SENSOR_RECORDS);

        auto now = unixTime();
        uint32_t firstReading = now - static_cast<uint32_t>(records) * readings;
        firstReading -= firstReading % 60;

        SensorMulti multi;
        multi.battery = sensors.readBattery();
        multi.rssi = modem.readRssi();
        multi.firstReading = firstReading;
        multi.interval = toWireSeconds(readings);
        for (std::size_t i = 0; i < records; i++) {
            multi.records.push_back(SensorRecord{sensors.readTemperature(), sensors.readHumidity()});
        }

        auto packet = makeTelemetryPacket(deviceId, id, now, readLocation(), multi);
        sendAndAwait(packet, "Telemetry");

        if (!sleepFor(std::chrono::seconds(interval))) {
            break;
        }
    }
    info("Telemetry stopped.");
}

void Client::motionLoop() {
    info("Motion reporting started.");
    auto windowStart = unixTime();
    while (!stopping) {
        auto motionInterval = settings.snapshot()->motionInterval;
        if (motionInterval == 0) {
            // Disabled; check again later in case the collector enables it
            if (!sleepFor(std::chrono::seconds(MIN_INTERVAL_SECONDS))) {
                break;
            }
            windowStart = unixTime();
            continue;
        }

        if (!sleepFor(std::chrono::seconds(motionInterval))) {
            break;
        }

        auto now = unixTime();
        SensorMotion motion;
        motion.battery = sensors.readBattery();
        motion.rssi = modem.readRssi();
        motion.windowStart = windowStart;
        motion.windowSeconds = toWireSeconds(now - windowStart);
        motion.steps = sensors.readSteps(now - windowStart);
        windowStart = now;

        auto packet = makeMotionPacket(deviceId, correlator.nextId(), now, readLocation(), motion);
        sendAndAwait(packet, "Motion Summary");
    }
    info("Motion reporting stopped.");
}

}
