#include "shutdown_signal.h"
#include "utils.h"
#include <chrono>
#include <csignal>
#include <stdexcept>

std::atomic<bool> ShutdownSignal::requested_{false};

ShutdownSignal::ShutdownSignal(std::function<void()> on_signal)
    : on_signal_(std::move(on_signal)) {}

ShutdownSignal::~ShutdownSignal() {
    stop();
}

void ShutdownSignal::notify(int) {
    requested_.store(true);
}

void ShutdownSignal::install() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (installed_) {
        return;
    }
    if (std::signal(SIGINT, &ShutdownSignal::notify) == SIG_ERR ||
        std::signal(SIGTERM, &ShutdownSignal::notify) == SIG_ERR) {
        throw std::runtime_error("failed to install SIGINT/SIGTERM handlers");
    }
    installed_ = true;
    stopping_ = false;
    watcher_ = std::thread(&ShutdownSignal::watch, this);
}

void ShutdownSignal::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!installed_) {
            return;
        }
        installed_ = false;
        stopping_ = true;
    }
    cv_.notify_all();
    if (watcher_.joinable()) {
        watcher_.join();
    }

    if (std::signal(SIGINT, SIG_DFL) == SIG_ERR || std::signal(SIGTERM, SIG_DFL) == SIG_ERR) {
        Utils::log_warn("failed to restore default SIGINT/SIGTERM handlers");
    }
}

void ShutdownSignal::watch() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        // 信号处理函数不能通知条件变量，这里按 100ms 轮询标志
        if (cv_.wait_for(lock, std::chrono::milliseconds(100), [this] { return stopping_; })) {
            break;
        }
        if (requested_.load()) {
            lock.unlock();
            Utils::log_info("shutdown signal received");
            if (on_signal_) {
                on_signal_();
            }
            return;
        }
    }
}
