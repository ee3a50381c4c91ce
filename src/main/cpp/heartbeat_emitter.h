#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include "stream_pipe.h"

// 心跳定时器：每个周期在未完成时向输出流写一帧心跳。
// stop() 之后不可再 start()；stop() 会等待正在进行的那一次写入结束。
class HeartbeatEmitter {
public:
    HeartbeatEmitter(std::shared_ptr<StreamPipe> pipe,
                     std::chrono::milliseconds interval,
                     std::function<bool()> is_complete);
    ~HeartbeatEmitter();

    HeartbeatEmitter(const HeartbeatEmitter&) = delete;
    HeartbeatEmitter& operator=(const HeartbeatEmitter&) = delete;

    // 启动定时器；已启动或已停止时返回 false
    bool start();

    // 永久停止；可从任意线程重复调用（心跳线程自身除外）
    void stop();

    // 在与心跳写入互斥的区间内执行 fn；fn 里置完成标志后不会再有心跳写出
    void exclusive(const std::function<void()>& fn);

    bool is_stopped() const { return stopped_.load(); }
    size_t beats_sent() const { return beats_.load(); }

private:
    void run();

    std::shared_ptr<StreamPipe> pipe_;
    std::chrono::milliseconds interval_;
    std::function<bool()> is_complete_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    bool started_ = false;

    // 完成检查 + 写入 与 exclusive() 互斥
    std::mutex tick_mutex_;

    std::mutex join_mutex_;
    std::thread thread_;

    std::atomic<bool> stopped_{false};
    std::atomic<size_t> beats_{0};
};
