//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the bounded pending-message queue.
///
//===----------------------------------------------------------------------===//

#include "srcnav/LSP/MessageQueue.h"

#include <algorithm>
#include <utility>

namespace srcnav::lsp
{

MessageQueue::MessageQueue(const std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1U))
{
}

bool MessageQueue::put(PendingEntry entry)
{
    {
        std::unique_lock<std::mutex> lock(mutex_);
        notFull_.wait(lock, [this]() { return closed_ || entries_.size() < capacity_; });
        if (closed_)
        {
            return false;
        }
        entries_.push_back(std::move(entry));
    }
    notEmpty_.notify_one();
    return true;
}

std::optional<PendingEntry> MessageQueue::poll(const std::chrono::milliseconds timeout)
{
    std::optional<PendingEntry> entry;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!notEmpty_.wait_for(lock, timeout, [this]() { return closed_ || !entries_.empty(); }))
        {
            return std::nullopt;
        }
        if (entries_.empty())
        {
            return std::nullopt;
        }
        entry.emplace(std::move(entries_.front()));
        entries_.pop_front();
    }
    notFull_.notify_one();
    return entry;
}

bool MessageQueue::removeRequest(const std::int64_t id)
{
    std::size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto                  before = entries_.size();
        entries_.erase(std::remove_if(entries_.begin(),
                                      entries_.end(),
                                      [id](const PendingEntry& entry) {
                                          const auto* message = std::get_if<Message>(&entry);
                                          return message && message->id && *message->id == id;
                                      }),
                       entries_.end());
        removed = before - entries_.size();
    }
    if (removed > 0U)
    {
        notFull_.notify_all();
    }
    return removed > 0U;
}

void MessageQueue::close()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    notEmpty_.notify_all();
    notFull_.notify_all();
}

bool MessageQueue::closed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t MessageQueue::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace srcnav::lsp
