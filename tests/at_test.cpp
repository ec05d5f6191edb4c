/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <celltrack/at.hpp>
#include "fake_modem.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

namespace celltrack {
namespace {

using test_support::FakeModem;
using namespace std::chrono_literals;

class AtTerminalTest : public ::testing::Test {
protected:
    FakeModem fake;
};

// ============================================================================
// Command / Response Tests
// ============================================================================

TEST_F(AtTerminalTest, Imei_ReturnsDataAndSuccess) {
    fake.respond("AT+CGSN", {"\"358419511056392\"", "OK"});

    auto rsp = fake.terminal.sendCommand("AT+CGSN");

    EXPECT_TRUE(rsp.success);
    EXPECT_EQ(rsp.command, "AT+CGSN");
    ASSERT_TRUE(rsp.hasData());
    EXPECT_EQ(rsp.data(), "\"358419511056392\"");
    ASSERT_EQ(rsp.fields.size(), 1u);
    EXPECT_EQ(rsp.fields[0], "358419511056392");
}

TEST_F(AtTerminalTest, OkWithoutData_HasNoData) {
    auto rsp = fake.terminal.sendCommand("ATE0");
    EXPECT_TRUE(rsp.success);
    EXPECT_FALSE(rsp.hasData());
    EXPECT_EQ(rsp.data(), "");
    EXPECT_TRUE(rsp.fields.empty());
}

TEST_F(AtTerminalTest, Error_ReturnsFailure) {
    fake.respond("AT+BOGUS", {"ERROR"});
    auto rsp = fake.terminal.sendCommand("AT+BOGUS");
    EXPECT_FALSE(rsp.success);
    EXPECT_FALSE(rsp.hasData());
}

TEST_F(AtTerminalTest, CmeError_FailsAndKeepsReason) {
    fake.respond("AT%CCID", {"+CME ERROR: SIM not inserted"});
    auto rsp = fake.terminal.sendCommand("AT%CCID");
    EXPECT_FALSE(rsp.success);
    ASSERT_TRUE(rsp.hasData());
    EXPECT_EQ(rsp.data(), "+CME ERROR: SIM not inserted");
}

TEST_F(AtTerminalTest, NoTerminator_TimesOutWithoutData) {
    fake.silence("AT+CGSN");
    auto start = std::chrono::steady_clock::now();
    auto rsp = fake.terminal.sendCommand("AT+CGSN");
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(rsp.success);
    EXPECT_FALSE(rsp.hasData());
    EXPECT_GE(elapsed, 150ms);
}

TEST_F(AtTerminalTest, DataWithoutTerminator_TimesOut) {
    fake.respond("AT+CSQ", {"+CSQ: 17,99"});
    auto rsp = fake.terminal.sendCommand("AT+CSQ");
    EXPECT_FALSE(rsp.success);
}

TEST_F(AtTerminalTest, DefaultCommandTimeout_IsFiveSeconds) {
    AtTerminal terminal;
    EXPECT_EQ(terminal.commandTimeout(), std::chrono::milliseconds(5000));
}

TEST_F(AtTerminalTest, NoWriter_Throws) {
    AtTerminal terminal;
    EXPECT_THROW(terminal.sendCommand("AT"), std::logic_error);
}

TEST_F(AtTerminalTest, WriterFailure_ReturnsFailure) {
    AtTerminal terminal(100ms);
    terminal.setWriter([](const std::string&) { throw std::runtime_error("port closed"); });
    auto rsp = terminal.sendCommand("AT+CGSN");
    EXPECT_FALSE(rsp.success);
    EXPECT_FALSE(rsp.hasData());
}

TEST_F(AtTerminalTest, CommandsAreTerminatedWithCrLf) {
    std::string written;
    AtTerminal terminal(100ms);
    terminal.setWriter([&](const std::string& data) {
        written = data;
        terminal.processLine("OK");
    });
    terminal.sendCommand("ATE0");
    EXPECT_EQ(written, "ATE0\r\n");
}

// ============================================================================
// Line Classification Tests
// ============================================================================

TEST_F(AtTerminalTest, LabelPrefix_IsStripped) {
    fake.respond("AT+CSQ", {"+CSQ: 17,99", "OK"});
    auto rsp = fake.terminal.sendCommand("AT+CSQ");
    ASSERT_TRUE(rsp.success);
    EXPECT_EQ(rsp.data(), "17,99");
    ASSERT_EQ(rsp.fields.size(), 2u);
    EXPECT_EQ(rsp.fields[0], "17");
    EXPECT_EQ(rsp.fields[1], "99");
}

TEST_F(AtTerminalTest, QuotedColon_IsNotALabel) {
    fake.respond("AT+TEST", {"\"a:b\",1", "OK"});
    auto rsp = fake.terminal.sendCommand("AT+TEST");
    EXPECT_EQ(rsp.data(), "\"a:b\",1");
    ASSERT_EQ(rsp.fields.size(), 2u);
    EXPECT_EQ(rsp.fields[0], "a:b");
}

TEST_F(AtTerminalTest, MultipleDataLines_AreKeptInOrder) {
    fake.respond("AT+CGMR", {"", "MOD_1.0", "UE_2.0", "", "OK"});
    auto rsp = fake.terminal.sendCommand("AT+CGMR");
    ASSERT_EQ(rsp.lines.size(), 2u);
    EXPECT_EQ(rsp.lines[0], "MOD_1.0");
    EXPECT_EQ(rsp.lines[1], "UE_2.0");
    EXPECT_EQ(rsp.data(), "MOD_1.0");
}

TEST_F(AtTerminalTest, EventDuringCommand_GoesToEventQueue) {
    fake.respond("AT+CSQ", {"%SOCKETEV:1,1", "+CSQ: 20,99", "OK"});
    auto rsp = fake.terminal.sendCommand("AT+CSQ");

    EXPECT_TRUE(rsp.success);
    EXPECT_EQ(rsp.data(), "20,99");

    auto event = fake.terminal.waitForEvent(100ms);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->tag, "SOCKETEV");
    EXPECT_EQ(event->payload, "1,1");
}

TEST_F(AtTerminalTest, ResponseWithOwnPercentLabel_IsData) {
    fake.respond("AT%SOCKETDATA", {"%SOCKETDATA:1,2,2,\"4142\",\"10.0.0.1\",10106", "OK"});
    auto rsp = fake.terminal.sendCommand("AT%SOCKETDATA=\"RECEIVE\",1,1500");

    ASSERT_TRUE(rsp.success);
    ASSERT_EQ(rsp.fields.size(), 6u);
    EXPECT_EQ(rsp.fields[0], "1");
    EXPECT_EQ(rsp.fields[3], "4142");
    EXPECT_EQ(rsp.fields[4], "10.0.0.1");
    EXPECT_FALSE(fake.terminal.waitForEvent(10ms).has_value());
}

TEST_F(AtTerminalTest, UnsolicitedEvent_IsQueued) {
    fake.terminal.processLine("%SOCKETEV:1,1");
    fake.terminal.processLine("%NOTIFYEV:\"LTIME\",\"2025/01/01\"");

    auto first = fake.terminal.waitForEvent(100ms);
    auto second = fake.terminal.waitForEvent(100ms);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->tag, "SOCKETEV");
    EXPECT_EQ(second->tag, "NOTIFYEV");
    EXPECT_EQ(second->payload, "\"LTIME\",\"2025/01/01\"");
}

TEST_F(AtTerminalTest, NoEvent_WaitTimesOut) {
    EXPECT_FALSE(fake.terminal.waitForEvent(20ms).has_value());
}

TEST_F(AtTerminalTest, StrayLines_AreDiscarded) {
    fake.terminal.processLine("+CEREG: 5");
    fake.terminal.processLine("OK");
    auto rsp = fake.terminal.sendCommand("ATE0");
    EXPECT_TRUE(rsp.success);
    EXPECT_FALSE(rsp.hasData());
    EXPECT_EQ(fake.terminal.events().size(), 0u);
}

TEST_F(AtTerminalTest, ConcurrentCallers_AreSerialized) {
    std::atomic<int> active = 0;
    std::atomic<int> maxActive = 0;
    fake.respond("AT+", [&](const std::string& command) {
        int now = ++active;
        int seen = maxActive.load();
        while (now > seen && !maxActive.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(5ms);
        --active;
        return std::vector<std::string>{command.substr(2), "OK"};
    });

    std::vector<std::thread> threads;
    std::atomic<int> matched = 0;
    for (int i = 0; i < 8; i++) {
        threads.emplace_back([&, i] {
            auto command = "AT+T" + std::to_string(i);
            auto rsp = fake.terminal.sendCommand(command);
            if (rsp.success && rsp.data() == command.substr(2)) {
                matched++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(maxActive.load(), 1);
    EXPECT_EQ(matched.load(), 8);
}

// ============================================================================
// Helper Tests
// ============================================================================

TEST_F(AtTerminalTest, CommandName_ExtendedCommands) {
    EXPECT_EQ(AtTerminal::commandName("AT+CGSN"), "+CGSN");
    EXPECT_EQ(AtTerminal::commandName("AT+COPS?"), "+COPS");
    EXPECT_EQ(AtTerminal::commandName("AT+COPS=3,2"), "+COPS");
    EXPECT_EQ(AtTerminal::commandName("AT%SOCKETDATA=\"SEND\",1"), "%SOCKETDATA");
}

TEST_F(AtTerminalTest, CommandName_BasicCommands) {
    EXPECT_EQ(AtTerminal::commandName("ATE0"), "ATE0");
    EXPECT_EQ(AtTerminal::commandName("AT"), "AT");
}

TEST_F(AtTerminalTest, SplitFields_HandlesQuotesAndSpaces) {
    auto fields = AtTerminal::splitFields(" 1 , \"a,b\" ,,3");
    ASSERT_EQ(fields.size(), 4u);
    EXPECT_EQ(fields[0], "1");
    EXPECT_EQ(fields[1], "a,b");
    EXPECT_EQ(fields[2], "");
    EXPECT_EQ(fields[3], "3");
}

TEST_F(AtTerminalTest, ResponseField_UsesFallback) {
    AtResponse rsp;
    rsp.fields = {"a"};
    EXPECT_EQ(rsp.field(0), "a");
    EXPECT_EQ(rsp.field(3, "none"), "none");
}

} // namespace
} // namespace celltrack
