/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __CELLTRACK_EVENT_QUEUE_HPP
#define __CELLTRACK_EVENT_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

namespace celltrack {

/** An unsolicited result line from the modem: %TAG:payload */
struct AtEvent {
    std::string tag;
    std::string payload;
};

/**
 * FIFO hand-off of modem events from the line reader to a single
 * consumer. Pushing never blocks.
 */
class EventQueue {
public:
    EventQueue() = default;

    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    void push(AtEvent event);

    /** Wait up to `timeout` for the next event; std::nullopt on timeout or once closed and drained */
    std::optional<AtEvent> pop(std::chrono::milliseconds timeout);

    /** Wake every waiting consumer; later pops only drain what is left */
    void close();

    bool isClosed() const;
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<AtEvent> events_;
    bool closed_ = false;
};

} // namespace celltrack

#endif
