#include "periodic_task.hpp"
#include <cstdio>
#include <exception>

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lk(m_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool CancellationToken::wait_for(std::chrono::milliseconds d) const {
    std::unique_lock<std::mutex> lk(m_);
    cv_.wait_for(lk, d, [this] { return cancelled_.load(); });
    return !cancelled_;
}

PeriodicTask::PeriodicTask(std::string name, Body body)
    : name_(std::move(name)), body_(std::move(body)) {}

PeriodicTask::~PeriodicTask() {
    stop();
}

bool PeriodicTask::start(std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lk(m_);
    if (token_ && !token_->cancelled()) return false;

    // A previous run that stopped itself from inside the body is still joinable.
    if (th_.joinable() && th_.get_id() != std::this_thread::get_id()) th_.join();
    else if (th_.joinable()) th_.detach();

    token_ = std::make_shared<CancellationToken>();
    th_ = std::thread(&PeriodicTask::loop, this, token_, interval);
    return true;
}

void PeriodicTask::request_stop() {
    std::lock_guard<std::mutex> lk(m_);
    if (token_) token_->cancel();
}

void PeriodicTask::stop() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lk(m_);
        if (token_) token_->cancel();
        if (!th_.joinable()) return;
        // stop() from inside the body: the loop exits on its own.
        if (th_.get_id() == std::this_thread::get_id()) return;
        worker = std::move(th_);
    }
    worker.join();
}

bool PeriodicTask::running() const {
    std::lock_guard<std::mutex> lk(m_);
    return token_ && !token_->cancelled();
}

void PeriodicTask::loop(std::shared_ptr<CancellationToken> token, std::chrono::milliseconds interval) {
    while (!token->cancelled()) {
        try {
            body_(*token);
        } catch (const std::exception& e) {
            fprintf(stderr, "[%s] cycle failed: %s\n", name_.c_str(), e.what());
        }
        if (!token->wait_for(interval)) break;
    }
}
