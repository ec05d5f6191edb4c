/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __CELLTRACK_AT_HPP
#define __CELLTRACK_AT_HPP

#include <celltrack/event_queue.hpp>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace celltrack {

constexpr std::chrono::seconds COMMAND_TIMEOUT{5};
constexpr std::chrono::seconds EVENT_TIMEOUT{5};

/**
 * Result of one AT command.
 *
 * `lines` holds the response data with any "label:" prefix removed. It is
 * empty when the modem sent no data. `fields` is the first data line split
 * on commas outside of quotes, with the quotes removed.
 */
struct AtResponse {
    std::string command;
    bool success = false;
    std::vector<std::string> lines;
    std::vector<std::string> fields;

    bool hasData() const { return !lines.empty(); }

    /** First data line, or an empty string */
    std::string data() const;

    /** Positional field, or `fallback` when the response has fewer fields */
    std::string field(std::size_t index, const std::string& fallback = "") const;
};

/**
 * Multiplexes a line-oriented AT channel.
 *
 * Lines read from the modem are fed to processLine(). Status terminators
 * complete the command in flight, %TAG:payload lines become events, and
 * everything else is response data. sendCommand() writes one command and
 * blocks until its terminator arrives; only one command is in flight at a
 * time. Events are consumed with waitForEvent().
 *
 * Usage:
 *   AtTerminal terminal;
 *   terminal.setWriter([&port](const std::string& s) { port.write(s); });
 *   auto rsp = terminal.sendCommand("AT+CGSN");
 *   if (rsp.success) { imei = rsp.data(); }
 */
class AtTerminal {
public:
    using Writer = std::function<void(const std::string&)>;

    explicit AtTerminal(std::chrono::milliseconds commandTimeout = COMMAND_TIMEOUT)
        : commandTimeout_(commandTimeout) {}
    ~AtTerminal() = default;

    // Non-copyable, non-movable (due to mutex)
    AtTerminal(const AtTerminal&) = delete;
    AtTerminal& operator=(const AtTerminal&) = delete;
    AtTerminal(AtTerminal&&) = delete;
    AtTerminal& operator=(AtTerminal&&) = delete;

    /** Set the function that writes raw bytes to the modem. Must be set before sending. */
    void setWriter(Writer writer);

    /**
     * Classify one line read from the modem (terminator already removed).
     */
    void processLine(std::string_view line);

    /**
     * Send a command and wait for its OK/ERROR.
     *
     * A missing terminator is not an error: the response comes back with
     * success=false and whatever data arrived before the timeout.
     */
    AtResponse sendCommand(const std::string& command);

    /** Wait for the next unsolicited event */
    std::optional<AtEvent> waitForEvent(std::chrono::milliseconds timeout = EVENT_TIMEOUT);

    EventQueue& events() { return events_; }

    std::chrono::milliseconds commandTimeout() const { return commandTimeout_; }

    /** "+CGSN" for "AT+CGSN", "%SOCKETDATA" for "AT%SOCKETDATA=...", the whole command otherwise */
    static std::string commandName(std::string_view command);

    /** Split on commas outside of quotes and remove the quotes */
    static std::vector<std::string> splitFields(std::string_view data);

private:
    const std::chrono::milliseconds commandTimeout_;
    Writer writer_;

    // Serializes sendCommand callers
    std::mutex gateMutex_;

    // Guards the in-flight command state below
    std::mutex stateMutex_;
    std::condition_variable responseCV_;
    bool inFlight_ = false;
    std::string inFlightName_;
    bool completed_ = false;
    bool success_ = false;
    std::vector<std::string> data_;

    EventQueue events_;

    void complete(bool success);
    static std::optional<AtEvent> parseEvent(std::string_view line);
    static std::string stripLabel(std::string_view line);
};

} // namespace celltrack

#endif
