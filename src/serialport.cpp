/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <celltrack/serialport.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <memory>
#include <stdexcept>
#include <asio.hpp>

using spdlog::debug;
using spdlog::info;
using spdlog::warn;
using spdlog::error;

namespace celltrack {

using asio::error_code;


///// SerialPort Implementation /////

SerialPort::SerialPort(asio::io_context& io, const std::string& name, const std::string& device, const SerialPortOptions& options)
    : io_(io)
    , name_(name)
    , device_(device)
    , options_(options)
    , port_(io)
    , reopenTimer_(io)
    , reopenDelay_(options.minReopenDelay) {}

bool SerialPort::start() {
    closing_ = false;
    if (!open()) {
        return false;
    }
    readNextLine();
    started();
    return true;
}

template <typename Option>
void SerialPort::applyOption(const Option& option, const char* what, const std::string& value) {
    error_code ec;
    port_.set_option(option, ec);
    if (ec) {
        error("Failed to set {} serial port {} to {}: {}", name_, what, value, ec.message());
    } else {
        debug("{} serial port {} set to {}.", name_, what, value);
    }
}

bool SerialPort::open() {
    error_code ec;

    if (port_.is_open()) {
        port_.close(ec);
        if (ec) {
            error("Failed to close {} serial port: {}", name_, ec.message());
        } else {
            info("{} serial port closed.", name_);
        }
    }

    port_.open(device_, ec);
    if (ec) {
        error("Failed to open {} serial port {}: {}", name_, device_, ec.message());
        return false;
    }

    applyOption(asio::serial_port_base::baud_rate(options_.baudRate), "baud rate",
        fmt::format("{}bps", options_.baudRate));
    applyOption(asio::serial_port_base::character_size(options_.characterSize), "character size",
        fmt::format("{} bits", options_.characterSize));
    applyOption(asio::serial_port_base::parity(options_.parity), "parity",
        ParityToString(options_.parity));
    applyOption(asio::serial_port_base::stop_bits(options_.stopBits), "stop bits",
        StopBitsToString(options_.stopBits));
    applyOption(asio::serial_port_base::flow_control(options_.flowControl), "flow control",
        FlowControlToString(options_.flowControl));

    // Drop any partial line left over from before a reopen
    readBuffer_.consume(readBuffer_.size());

    info("{} serial port {} initialized.", name_, device_);
    return true;
}

void SerialPort::close() {
    closing_ = true;
    reopenTimer_.cancel();
    if (port_.is_open()) {
        error_code ec;
        port_.close(ec);
        if (ec) {
            error("Failed to close {} serial port: {}", name_, ec.message());
        } else {
            info("{} serial port closed.", name_);
        }
    }
}

void SerialPort::readNextLine() {

    if (!port_.is_open()) {
        error("{} serial port is not open for reading.", name_);
        return;
    }

    asio::async_read_until(port_, readBuffer_, options_.readTerminator,
        [this](const error_code& ec, std::size_t bytes_transferred) {
            if (ec) {
                if (closing_ || ec == asio::error::operation_aborted) {
                    return;
                }
                error("{} serial port read error: {}", name_, ec.message());
                error_code closeError;
                port_.close(closeError);
                scheduleReopen();
                return;
            }

            auto bufs = readBuffer_.data();
            std::size_t len = bytes_transferred - options_.readTerminator.length();
            std::string line(asio::buffers_begin(bufs), asio::buffers_begin(bufs) + len);
            readBuffer_.consume(bytes_transferred);

            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }

            debug("Received on {} serial port: {}", name_, line);

            processOutput(line);

            readNextLine();
        });
}

void SerialPort::scheduleReopen() {
    auto delay = reopenDelay_.load();
    warn("Reopening {} serial port in {}ms.", name_, delay.count());
    reopenTimer_.expires_after(delay);
    reopenTimer_.async_wait([this](const error_code& ec) {
        if (ec || closing_) {
            return;
        }
        if (open()) {
            reopenDelay_ = options_.minReopenDelay;
            readNextLine();
            started();
        } else {
            reopenDelay_ = std::min(reopenDelay_.load() * 2, options_.maxReopenDelay);
            scheduleReopen();
        }
    });
}

std::string SerialPort::ParityToString(asio::serial_port_base::parity::type parity) {
    switch (parity) {
        case asio::serial_port_base::parity::none:
            return "None";
        case asio::serial_port_base::parity::odd:
            return "Odd";
        case asio::serial_port_base::parity::even:
            return "Even";
        default:
            return "Unknown";
    }
}

std::string SerialPort::StopBitsToString(asio::serial_port_base::stop_bits::type stopBits) {
    switch (stopBits) {
        case asio::serial_port_base::stop_bits::one:
            return "1";
        case asio::serial_port_base::stop_bits::onepointfive:
            return "1.5";
        case asio::serial_port_base::stop_bits::two:
            return "2";
        default:
            return "?";
    }
}

std::string SerialPort::FlowControlToString(asio::serial_port_base::flow_control::type flowControl) {
    switch (flowControl) {
        case asio::serial_port_base::flow_control::none:
            return "None";
        case asio::serial_port_base::flow_control::software:
            return "Software";
        case asio::serial_port_base::flow_control::hardware:
            return "Hardware";
        default:
            return "Unknown";
    }
}

void SerialPort::processOutput(std::string &data) {
    info("Received data on {} serial port: {}", name_, data);
}

void SerialPort::write(const std::string& data) {
    if (!port_.is_open()) {
        throw std::runtime_error("Serial port not open: " + name_);
    }
    auto buffer = std::make_shared<std::string>(data);
    // Writes run on the I/O context so they never race with the pending read
    asio::post(io_, [this, buffer]() {
        if (!port_.is_open()) {
            error("Dropping write on closed {} serial port.", name_);
            return;
        }
        asio::async_write(port_, asio::buffer(*buffer),
            [this, buffer](const error_code& ec, std::size_t /*bytes_transferred*/) {
                if (ec) {
                    error("Failed to write on {} serial port: {}", name_, ec.message());
                }
            });
    });
}

///// ModemSerialPort Implementation /////

void ModemSerialPort::processOutput(std::string &data) {
    terminal_.processLine(data);
}

} // namespace celltrack
