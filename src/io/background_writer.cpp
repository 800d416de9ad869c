#include "io/background_writer.h"

#include "core/log.h"

#include <exception>

namespace omnote
{
BackgroundWriter::BackgroundWriter(std::string name)
    : name_(std::move(name))
{
}

BackgroundWriter::~BackgroundWriter()
{
    Stop();
}

void BackgroundWriter::StartWorker()
{
    // mu_ held by caller.
    if (worker_running_)
        return;
    if (worker_.joinable())
        worker_.join();
    worker_running_ = true;
    stop_requested_ = false;
    worker_ = std::thread([this]() { Run(); });
}

void BackgroundWriter::Run()
{
    for (;;)
    {
        std::pair<std::string, Job> job;
        {
            std::unique_lock<std::mutex> lock(mu_);
            cv_.wait(lock, [&]() { return stop_requested_ || !pending_.empty(); });
            if (pending_.empty())
            {
                // stop_requested_ and nothing left to do.
                worker_running_ = false;
                idle_cv_.notify_all();
                return;
            }
            job = std::move(pending_.front());
            pending_.erase(pending_.begin());
            busy_ = true;
        }

        try
        {
            if (job.second)
                job.second();
        }
        catch (const std::exception& e)
        {
            OMNOTE_LOG_ERROR("writer", "%s: job '%s' threw: %s", name_.c_str(), job.first.c_str(), e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mu_);
            busy_ = false;
            if (pending_.empty())
                idle_cv_.notify_all();
        }
    }
}

void BackgroundWriter::Submit(const std::string& key, Job job)
{
    {
        std::lock_guard<std::mutex> lock(mu_);
        bool replaced = false;
        for (auto& p : pending_)
        {
            if (p.first == key)
            {
                p.second = std::move(job);
                replaced = true;
                break;
            }
        }
        if (!replaced)
            pending_.emplace_back(key, std::move(job));
        StartWorker();
    }
    cv_.notify_one();
}

bool BackgroundWriter::Cancel(const std::string& key)
{
    std::lock_guard<std::mutex> lock(mu_);
    for (auto it = pending_.begin(); it != pending_.end(); ++it)
    {
        if (it->first == key)
        {
            pending_.erase(it);
            if (pending_.empty() && !busy_)
                idle_cv_.notify_all();
            return true;
        }
    }
    return false;
}

void BackgroundWriter::Flush()
{
    std::unique_lock<std::mutex> lock(mu_);
    if (!worker_running_)
        return;
    idle_cv_.wait(lock, [&]() { return (pending_.empty() && !busy_) || !worker_running_; });
}

void BackgroundWriter::Stop()
{
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!worker_running_ && !worker_.joinable())
            return;
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable())
        worker_.join();
    std::lock_guard<std::mutex> lock(mu_);
    worker_running_ = false;
    stop_requested_ = false;
}

size_t BackgroundWriter::PendingCount() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return pending_.size() + (busy_ ? 1u : 0u);
}
} // namespace omnote
