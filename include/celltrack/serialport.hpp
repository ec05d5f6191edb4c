/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __CELLTRACK_SERIALPORT_HPP
#define __CELLTRACK_SERIALPORT_HPP

#include <atomic>
#include <chrono>
#include <string>
#include <asio.hpp>
#include <celltrack/at.hpp>

namespace celltrack {

struct SerialPortOptions {
    int baudRate = 115200;
    int characterSize = 8;
    asio::serial_port_base::parity::type parity = asio::serial_port_base::parity::none;
    asio::serial_port_base::stop_bits::type stopBits = asio::serial_port_base::stop_bits::one;
    asio::serial_port_base::flow_control::type flowControl = asio::serial_port_base::flow_control::none;
    std::string readTerminator = "\r\n";
    std::chrono::milliseconds minReopenDelay{1000};
    std::chrono::milliseconds maxReopenDelay{30000};
};

/**
 * A serial port that reads terminated lines on the I/O context.
 *
 * A read failure closes the port and reopens it with exponential backoff
 * between minReopenDelay and maxReopenDelay. Reopening never gives up;
 * process supervision is the last line of recovery.
 */
class SerialPort {
public:
    SerialPort(asio::io_context& io, const std::string& name, const std::string& device, const SerialPortOptions& options);
    virtual ~SerialPort() = default;

    /** Opens the serial port and starts reading lines */
    bool start();

    /** Stops reopening and closes the port. Call once the I/O context has stopped. */
    void close();

    const std::string& name() const { return name_; }
    const std::string& device() const { return device_; }
    bool isOpen() const { return port_.is_open(); }

    /** Delay before the next reopen attempt */
    std::chrono::milliseconds reopenDelay() const { return reopenDelay_.load(); }

    static std::string ParityToString(asio::serial_port_base::parity::type parity);
    static std::string StopBitsToString(asio::serial_port_base::stop_bits::type stopBits);
    static std::string FlowControlToString(asio::serial_port_base::flow_control::type flowControl);

    /** Execute any post-initialization code; also runs after every successful reopen */
    virtual void started() {}

    /** Process a line read from the serial port */
    virtual void processOutput(std::string &data);

    /** Queue bytes for writing. Throws std::runtime_error if the port is not open. */
    virtual void write(const std::string& data);

protected:
    asio::io_context& io_;
    std::string name_;
    std::string device_;
    SerialPortOptions options_;
    asio::serial_port port_;
    asio::streambuf readBuffer_;
    asio::steady_timer reopenTimer_;
    std::atomic<std::chrono::milliseconds> reopenDelay_;
    std::atomic<bool> closing_ = false;

    bool open();
    template <typename Option>
    void applyOption(const Option& option, const char* what, const std::string& value);
    virtual void readNextLine();
    void scheduleReopen();
};

/**
 * Serial port attached to the cellular modem; every line goes to the AT
 * terminal's classifier.
 */
class ModemSerialPort : public SerialPort {
public:
    ModemSerialPort(asio::io_context& io, const std::string& device, const SerialPortOptions& options, AtTerminal& terminal)
        : SerialPort(io, "Modem", device, options), terminal_(terminal) {}
    virtual ~ModemSerialPort() = default;

    void processOutput(std::string &data) override;

protected:
    AtTerminal& terminal_;
};

} // namespace celltrack

#endif
