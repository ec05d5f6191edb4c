/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <celltrack/at.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/ranges.h>

#include <cctype>
#include <stdexcept>

using spdlog::debug;
using spdlog::warn;
using spdlog::error;

namespace celltrack {

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

bool isErrorReport(std::string_view line) {
    return line.starts_with("+CME ERROR") || line.starts_with("+CMS ERROR");
}

} // namespace

///// AtResponse Implementation /////

std::string AtResponse::data() const {
    return lines.empty() ? std::string() : lines.front();
}

std::string AtResponse::field(std::size_t index, const std::string& fallback) const {
    return index < fields.size() ? fields[index] : fallback;
}

///// AtTerminal Implementation /////

void AtTerminal::setWriter(Writer writer) {
    std::lock_guard<std::mutex> gate(gateMutex_);
    writer_ = std::move(writer);
}

void AtTerminal::processLine(std::string_view line) {
    line = trim(line);
    if (line.empty()) {
        return;
    }

    if (line == "OK") {
        complete(true);
        return;
    }

    if (line == "ERROR") {
        complete(false);
        return;
    }

    if (isErrorReport(line)) {
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            if (inFlight_) {
                data_.push_back(stripLabel(line));
            }
        }
        complete(false);
        return;
    }

    if (auto event = parseEvent(line)) {
        std::unique_lock<std::mutex> lock(stateMutex_);
        // The response of an AT% command carries its own %NAME: label
        bool isResponse = inFlight_ && inFlightName_ == "%" + event->tag;
        lock.unlock();
        if (!isResponse) {
            debug("Event %{}: {}", event->tag, event->payload);
            events_.push(std::move(*event));
            return;
        }
    }

    std::lock_guard<std::mutex> lock(stateMutex_);
    if (!inFlight_) {
        debug("Discarding line with no command in flight: {}", line);
        return;
    }
    data_.push_back(stripLabel(line));
}

void AtTerminal::complete(bool success) {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (!inFlight_ || completed_) {
            debug("Ignoring {} with no command in flight", success ? "OK" : "ERROR");
            return;
        }
        success_ = success;
        completed_ = true;
    }
    responseCV_.notify_all();
}

AtResponse AtTerminal::sendCommand(const std::string& command) {
    std::lock_guard<std::mutex> gate(gateMutex_);

    if (!writer_) {
        throw std::logic_error("AT terminal has no writer");
    }

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        inFlight_ = true;
        inFlightName_ = commandName(command);
        completed_ = false;
        success_ = false;
        data_.clear();
    }

    AtResponse response;
    response.command = command;

    debug("Sending [{}]", command);
    try {
        writer_(command + "\r\n");
    } catch (const std::exception& e) {
        error("Failed to send [{}]: {}", command, e.what());
        std::lock_guard<std::mutex> lock(stateMutex_);
        inFlight_ = false;
        return response;
    }

    std::unique_lock<std::mutex> lock(stateMutex_);
    bool completed = responseCV_.wait_for(lock, commandTimeout_, [this] { return completed_; });

    response.success = completed && success_;
    response.lines = std::move(data_);
    data_.clear();
    inFlight_ = false;
    lock.unlock();

    if (!completed) {
        warn("Timed out after {}ms waiting for response to [{}]", commandTimeout_.count(), command);
    }
    if (!response.lines.empty()) {
        response.fields = splitFields(response.lines.front());
    }

    debug("Response [{}]: success={}, data={}", command, response.success,
        fmt::join(response.lines, " | "));
    return response;
}

std::optional<AtEvent> AtTerminal::waitForEvent(std::chrono::milliseconds timeout) {
    return events_.pop(timeout);
}

std::string AtTerminal::commandName(std::string_view command) {
    if (command.size() > 2 && command.starts_with("AT") && (command[2] == '+' || command[2] == '%')) {
        auto end = command.find_first_of("=?", 2);
        return std::string(command.substr(2, end == std::string_view::npos ? std::string_view::npos : end - 2));
    }
    return std::string(command);
}

std::vector<std::string> AtTerminal::splitFields(std::string_view data) {
    std::vector<std::string> fields;
    std::string current;
    bool inQuotes = false;

    for (char c : data) {
        if (c == '"') {
            inQuotes = !inQuotes;
        } else if (c == ',' && !inQuotes) {
            fields.push_back(std::string(trim(current)));
            current.clear();
        } else {
            current += c;
        }
    }
    fields.push_back(std::string(trim(current)));

    return fields;
}

std::optional<AtEvent> AtTerminal::parseEvent(std::string_view line) {
    // %TAG:payload where TAG is a word and payload is not empty
    if (line.size() < 4 || line[0] != '%') {
        return std::nullopt;
    }
    auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 1 || colon + 1 >= line.size()) {
        return std::nullopt;
    }
    auto tag = line.substr(1, colon - 1);
    for (char c : tag) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return std::nullopt;
        }
    }
    return AtEvent{std::string(tag), std::string(trim(line.substr(colon + 1)))};
}

std::string AtTerminal::stripLabel(std::string_view line) {
    auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return std::string(line);
    }
    auto label = line.substr(0, colon);
    if (label.find_first_of("\", ") != std::string_view::npos) {
        return std::string(line);
    }
    return std::string(trim(line.substr(colon + 1)));
}

} // namespace celltrack
