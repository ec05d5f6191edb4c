/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __CELLTRACK_TRANSACTIONS_HPP
#define __CELLTRACK_TRANSACTIONS_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>

namespace celltrack {

constexpr std::chrono::seconds ACK_TIMEOUT{30};

// Long acknowledgment waits are taken in slices of this size so that shutdown is not held up
constexpr std::chrono::seconds ACK_POLL_INTERVAL{1};

/**
 * Issues transaction ids and matches acknowledgments to the senders
 * waiting for them.
 *
 * Ids wrap after 65535. Two transactions with the same id are never in
 * flight at the same time in practice; this is assumed, not enforced.
 * Acknowledgments may arrive in any order.
 *
 * Usage:
 *   auto id = correlator.nextId();
 *   modem.sendPacket(...);
 *   if (!correlator.awaitAck(id, ACK_TIMEOUT)) { ... }
 *
 * and on the receiving side:
 *   correlator.resolve(id);
 */
class TransactionCorrelator {
public:
    TransactionCorrelator() = default;
    ~TransactionCorrelator() = default;

    // Non-copyable, non-movable (due to mutex)
    TransactionCorrelator(const TransactionCorrelator&) = delete;
    TransactionCorrelator& operator=(const TransactionCorrelator&) = delete;
    TransactionCorrelator(TransactionCorrelator&&) = delete;
    TransactionCorrelator& operator=(TransactionCorrelator&&) = delete;

    /**
     * Get the next transaction id. The first id is 1; the sequence wraps
     * from 65535 to 0. Reissuing an id forgets an acknowledgment remembered
     * from its previous use.
     */
    uint16_t nextId();

    /**
     * Wait until `id` is acknowledged.
     *
     * Returns immediately if the acknowledgment already arrived. Concurrent
     * waits on the same id share one pending entry.
     *
     * @return true if acknowledged before the timeout, false otherwise
     */
    bool awaitAck(uint16_t id, std::chrono::milliseconds timeout);

    /** Mark `id` as acknowledged and wake its waiters. Resolving twice is a no-op. */
    void resolve(uint16_t id);

    bool isAcknowledged(uint16_t id) const;

    /** Number of ids that currently have waiters */
    std::size_t pendingCount() const;

private:
    struct PendingAck {
        std::condition_variable cv;
        bool resolved = false;
        int waiters = 0;
    };

    mutable std::mutex mutex_;
    uint16_t lastId_ = 0;
    std::map<uint16_t, std::shared_ptr<PendingAck>> pending_;
    std::set<uint16_t> acknowledged_;
};

} // namespace celltrack

#endif
