/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <celltrack/serialport.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <pty.h>
#include <termios.h>
#include <unistd.h>

namespace celltrack {
namespace {

using namespace std::chrono_literals;

/** Serial port that records what it reads */
class RecordingSerialPort : public SerialPort {
public:
    using SerialPort::SerialPort;

    void started() override {
        std::lock_guard<std::mutex> lock(mutex);
        startCount++;
    }

    void processOutput(std::string &data) override {
        std::lock_guard<std::mutex> lock(mutex);
        lines.push_back(data);
    }

    int starts() {
        std::lock_guard<std::mutex> lock(mutex);
        return startCount;
    }

    bool received(const std::string& line) {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& l : lines) {
            if (l == line) {
                return true;
            }
        }
        return false;
    }

private:
    std::mutex mutex;
    std::vector<std::string> lines;
    int startCount = 0;
};

class SerialPortTest : public ::testing::Test {
protected:
    void SetUp() override {
        link = ::testing::TempDir() + "celltrack_serial_" + std::to_string(::getpid());
        ::unlink(link.c_str());
        options.readTerminator = "\r\n";
        options.minReopenDelay = 10ms;
        options.maxReopenDelay = 40ms;
    }

    void TearDown() override {
        io.stop();
        if (ioThread.joinable()) {
            ioThread.join();
        }
        if (port) {
            port->close();
        }
        if (master >= 0) {
            ::close(master);
        }
        ::unlink(link.c_str());
    }

    /** Opens a new pty pair and points the link at its slave side */
    void openPty() {
        int slave = -1;
        char name[256] = {0};
        ASSERT_EQ(::openpty(&master, &slave, name, nullptr, nullptr), 0);
        struct termios raw;
        ASSERT_EQ(::tcgetattr(slave, &raw), 0);
        ::cfmakeraw(&raw);
        ASSERT_EQ(::tcsetattr(slave, TCSANOW, &raw), 0);
        ::close(slave);

        ::unlink(link.c_str());
        ASSERT_EQ(::symlink(name, link.c_str()), 0);
    }

    void startPort() {
        port = std::make_unique<RecordingSerialPort>(io, "Test", link, options);
        ASSERT_TRUE(port->start());
        ioThread = std::thread([this] { io.run(); });
    }

    void send(const std::string& data) {
        ASSERT_EQ(::write(master, data.data(), data.size()), static_cast<ssize_t>(data.size()));
    }

    bool eventually(const std::function<bool()>& condition, std::chrono::milliseconds timeout = 5s) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!condition()) {
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            std::this_thread::sleep_for(5ms);
        }
        return true;
    }

    asio::io_context io;
    asio::executor_work_guard<asio::io_context::executor_type> work = asio::make_work_guard(io);
    std::thread ioThread;
    SerialPortOptions options;
    std::unique_ptr<RecordingSerialPort> port;
    std::string link;
    int master = -1;
};

TEST_F(SerialPortTest, Start_FailsForMissingDevice) {
    RecordingSerialPort missing(io, "Missing", link + "_absent", options);
    EXPECT_FALSE(missing.start());
    EXPECT_FALSE(missing.isOpen());
}

TEST_F(SerialPortTest, ReadsTerminatedLines) {
    openPty();
    startPort();

    send("AT\r\nOK\r\n");

    EXPECT_TRUE(eventually([this] { return port->received("AT") && port->received("OK"); }));
    EXPECT_EQ(port->starts(), 1);
    EXPECT_EQ(port->reopenDelay(), options.minReopenDelay);
}

TEST_F(SerialPortTest, ReadFailure_ReopensWithBackoffAndResets) {
    openPty();
    startPort();
    send("first\r\n");
    ASSERT_TRUE(eventually([this] { return port->received("first"); }));

    // Hang up the device; reopen attempts fail and the delay backs off to the maximum
    ::close(master);
    master = -1;
    EXPECT_TRUE(eventually([this] { return port->reopenDelay() == options.maxReopenDelay; }));
    EXPECT_EQ(port->starts(), 1);

    // The device comes back; the next attempt succeeds and the delay resets
    openPty();
    EXPECT_TRUE(eventually([this] { return port->starts() == 2; }));
    EXPECT_EQ(port->reopenDelay(), options.minReopenDelay);

    send("second\r\n");
    EXPECT_TRUE(eventually([this] { return port->received("second"); }));
}

} // namespace
} // namespace celltrack
