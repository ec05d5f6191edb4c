/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <celltrack/event_queue.hpp>

namespace celltrack {

void EventQueue::push(AtEvent event) {
    {
        std::scoped_lock lock(mutex_);
        events_.push(std::move(event));
    }
    cv_.notify_one();
}

std::optional<AtEvent> EventQueue::pop(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !events_.empty() || closed_; })) {
        return std::nullopt;
    }
    if (events_.empty()) {
        return std::nullopt;
    }
    AtEvent event = std::move(events_.front());
    events_.pop();
    return event;
}

void EventQueue::close() {
    {
        std::scoped_lock lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool EventQueue::isClosed() const {
    std::scoped_lock lock(mutex_);
    return closed_;
}

std::size_t EventQueue::size() const {
    std::scoped_lock lock(mutex_);
    return events_.size();
}

} // namespace celltrack
