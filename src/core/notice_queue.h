#pragma once

#include "core/error.h"

#include <deque>
#include <mutex>
#include <string>
#include <utility>

namespace omnote
{
// A non-modal warning for the UI layer ("Autosave failed: disk full").
struct Notice
{
    ErrorKind   kind = ErrorKind::PersistenceFailure;
    std::string message;
};

// Thread-safe FIFO of notices.
// Background writers Push(); the UI thread drains it with Poll() once per loop iteration.
class NoticeQueue
{
public:
    void Push(Notice n)
    {
        std::lock_guard<std::mutex> lock(mtx_);
        // Keep the queue bounded; a UI that never polls shouldn't grow it forever.
        if (queue_.size() >= kMaxPending)
            queue_.pop_front();
        queue_.push_back(std::move(n));
    }

    bool Poll(Notice& out)
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (queue_.empty())
            return false;
        out = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    size_t Size() const
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return queue_.size();
    }

private:
    static constexpr size_t kMaxPending = 64;

    mutable std::mutex mtx_;
    std::deque<Notice> queue_;
};
} // namespace omnote
