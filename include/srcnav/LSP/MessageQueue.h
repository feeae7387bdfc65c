//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Bounded queue of pending inbound messages with pre-dispatch cancellation.
///
/// The reader thread is the single producer and the dispatcher thread the
/// single consumer. Stream closure travels through the queue as a
/// `StreamClosed` entry so the consumer observes it in order.
///
//===----------------------------------------------------------------------===//
#ifndef SRCNAV_LSP_MESSAGE_QUEUE_H
#define SRCNAV_LSP_MESSAGE_QUEUE_H

#include "srcnav/LSP/Message.h"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <variant>

namespace srcnav::lsp
{

/// @brief Queue entry signalling that the client input stream closed.
struct StreamClosed final
{
};

/// @brief Entry held by the pending queue.
using PendingEntry = std::variant<Message, StreamClosed>;

/// @brief Default number of entries buffered before the reader blocks.
inline constexpr std::size_t DefaultQueueCapacity = 10;

/// @brief Bounded FIFO with blocking put, timed poll, and removal by request id.
class MessageQueue final
{
public:
    /// @brief Creates a queue.
    /// @param[in] capacity Maximum buffered entries; values below one are treated as one.
    explicit MessageQueue(std::size_t capacity = DefaultQueueCapacity);

    MessageQueue(const MessageQueue&)            = delete;
    MessageQueue& operator=(const MessageQueue&) = delete;

    /// @brief Appends an entry, blocking while the queue is full.
    /// @param[in] entry Entry to append.
    /// @return `false` when the queue was closed before the entry could be stored.
    [[nodiscard]] bool put(PendingEntry entry);

    /// @brief Removes the front entry, waiting up to `timeout` for one to arrive.
    /// @param[in] timeout Maximum wait.
    /// @return Front entry, or empty on timeout or when closed and drained.
    [[nodiscard]] std::optional<PendingEntry> poll(std::chrono::milliseconds timeout);

    /// @brief Removes every queued request whose id equals `id`.
    /// @param[in] id Request id to cancel.
    /// @return `true` when at least one entry was removed.
    [[nodiscard]] bool removeRequest(std::int64_t id);

    /// @brief Closes the queue and wakes all waiters.
    void close();

    /// @brief Returns whether `close()` was called.
    [[nodiscard]] bool closed() const;

    /// @brief Returns the number of buffered entries.
    [[nodiscard]] std::size_t size() const;

    /// @brief Returns the configured capacity.
    [[nodiscard]] std::size_t capacity() const
    {
        return capacity_;
    }

private:
    const std::size_t        capacity_;
    mutable std::mutex       mutex_;
    std::condition_variable  notEmpty_;
    std::condition_variable  notFull_;
    std::deque<PendingEntry> entries_;
    bool                     closed_{false};
};

}  // namespace srcnav::lsp

#endif  // SRCNAV_LSP_MESSAGE_QUEUE_H
