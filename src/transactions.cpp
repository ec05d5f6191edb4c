/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <celltrack/transactions.hpp>
#include <spdlog/spdlog.h>

using spdlog::debug;

namespace celltrack {

uint16_t TransactionCorrelator::nextId() {
    std::lock_guard<std::mutex> lock(mutex_);
    lastId_ = static_cast<uint16_t>(lastId_ + 1);
    acknowledged_.erase(lastId_);
    return lastId_;
}

bool TransactionCorrelator::awaitAck(uint16_t id, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (acknowledged_.contains(id)) {
        return true;
    }

    auto& entry = pending_[id];
    if (!entry) {
        entry = std::make_shared<PendingAck>();
    }
    auto pending = entry;
    pending->waiters++;

    bool resolved = pending->cv.wait_for(lock, timeout, [&pending] { return pending->resolved; });

    pending->waiters--;
    if (!resolved && pending->waiters == 0) {
        // resolve() removes resolved entries; only drop our own stale one
        auto it = pending_.find(id);
        if (it != pending_.end() && it->second == pending) {
            pending_.erase(it);
        }
    }

    if (!resolved) {
        debug("Timed out waiting for acknowledgment of transaction {}", id);
    }
    return resolved;
}

void TransactionCorrelator::resolve(uint16_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    acknowledged_.insert(id);

    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return;
    }
    it->second->resolved = true;
    it->second->cv.notify_all();
    pending_.erase(it);
}

bool TransactionCorrelator::isAcknowledged(uint16_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return acknowledged_.contains(id);
}

std::size_t TransactionCorrelator::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

} // namespace celltrack
