#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

// SIGINT / SIGTERM 处理：信号处理函数只置一个原子标志，
// 由监视线程在普通上下文里调用 on_signal（例如 Server::stop）。
class ShutdownSignal {
public:
    explicit ShutdownSignal(std::function<void()> on_signal);
    ~ShutdownSignal();

    ShutdownSignal(const ShutdownSignal&) = delete;
    ShutdownSignal& operator=(const ShutdownSignal&) = delete;

    // 注册信号处理并启动监视线程；注册失败抛 std::runtime_error
    void install();

    // 结束监视线程并恢复默认信号处理；可重复调用
    void stop();

    static bool requested() { return requested_.load(); }
    static void reset() { requested_.store(false); }

private:
    static void notify(int);
    void watch();

    static std::atomic<bool> requested_;

    std::function<void()> on_signal_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
    bool installed_ = false;
    std::thread watcher_;
};
