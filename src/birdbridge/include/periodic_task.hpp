#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

// Set once by the owner of a task; waits on it wake up immediately.
class CancellationToken {
public:
    void cancel();
    bool cancelled() const { return cancelled_; }

    // Sleeps up to `d`. Returns false if cancelled before or during the wait.
    bool wait_for(std::chrono::milliseconds d) const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex m_;
    mutable std::condition_variable cv_;
};

// Runs `body` on a worker thread, waiting `interval` after each run
// completes. Runs never overlap. A body that throws is logged and the
// schedule continues. Each start() gets a fresh token, so a stop()/start()
// pair never leaves a stale timer behind.
class PeriodicTask {
public:
    using Body = std::function<void(const CancellationToken&)>;

    PeriodicTask(std::string name, Body body);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    // Returns false if already running.
    bool start(std::chrono::milliseconds interval);
    // Cancels the token without waiting for the body to return.
    void request_stop();
    void stop();
    bool running() const;

private:
    void loop(std::shared_ptr<CancellationToken> token, std::chrono::milliseconds interval);

    std::string name_;
    Body body_;
    mutable std::mutex m_;
    std::shared_ptr<CancellationToken> token_;
    std::thread th_;
};
