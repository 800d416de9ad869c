#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace omnote
{
// Single worker thread that runs keyed disk jobs off the UI thread.
//
// - Jobs with the same key coalesce: a Submit() for a key that is still queued replaces the
//   queued job in place, so only the latest state for that key is ever written.
// - Jobs run one at a time in submission order of their keys, so two writes for the same
//   key can never land out of order.
// - The worker starts lazily on the first Submit().
class BackgroundWriter
{
public:
    using Job = std::function<void()>;

    explicit BackgroundWriter(std::string name);
    ~BackgroundWriter();

    BackgroundWriter(const BackgroundWriter&) = delete;
    BackgroundWriter& operator=(const BackgroundWriter&) = delete;

    void Submit(const std::string& key, Job job);

    // Drops a queued job (an in-flight one still completes). Returns true if one was dropped.
    bool Cancel(const std::string& key);

    // Blocks until every queued job has run.
    void Flush();

    // Runs whatever is still queued, then joins the worker. Further Submit() calls restart it.
    void Stop();

    size_t PendingCount() const;

private:
    void StartWorker();
    void Run();

    std::string name_;

    std::thread worker_;
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    bool worker_running_ = false;
    bool stop_requested_ = false;
    bool busy_ = false;

    std::vector<std::pair<std::string, Job>> pending_;
};
} // namespace omnote
