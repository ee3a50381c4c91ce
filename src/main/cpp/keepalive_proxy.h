#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <httplib.h>
#include "config.h"

// ":streamGenerateContent" 请求的保活处理：
// 立即返回 event-stream 响应，后台以非流式调用上游，期间定时发送心跳。
class KeepAliveProxy {
public:
    explicit KeepAliveProxy(const ProxyConfig& config);

    // 处理一个HTTP请求（不等待上游）
    void handle(const httplib::Request& req, httplib::Response& res);

    // 仍在进行的后台上游调用数
    size_t active_sessions() const;

    // 等待所有后台任务结束；超时返回 false
    bool wait_idle(std::chrono::milliseconds timeout);

private:
    void session_finished();

    ProxyConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    size_t active_ = 0;
};
