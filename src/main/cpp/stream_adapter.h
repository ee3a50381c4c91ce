#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "heartbeat_emitter.h"
#include "stream_pipe.h"
#include "upstream_client.h"

// 单个请求的流适配：输出流 + 心跳 + 后台上游调用。
// 状态 OPEN -> STREAMING -> DONE，DONE 只进入一次。
class StreamAdapter : public std::enable_shared_from_this<StreamAdapter> {
public:
    enum class State { Open, Streaming, Done };

    StreamAdapter(UpstreamRequest request,
                  std::chrono::milliseconds heartbeat_interval,
                  std::string id = "");
    ~StreamAdapter();

    StreamAdapter(const StreamAdapter&) = delete;
    StreamAdapter& operator=(const StreamAdapter&) = delete;

    // 启动心跳与上游调用，不阻塞；on_finished 在后台任务结束时调用
    bool start(std::function<void()> on_finished = nullptr);

    // 客户端断开
    void cancel(const std::string& reason);

    // 等待后台任务结束
    void join();

    std::shared_ptr<StreamPipe> stream() const { return pipe_; }
    State state() const { return state_.load(); }
    bool is_complete() const { return complete_.load(); }
    bool heartbeat_stopped() const { return heartbeat_.is_stopped(); }
    size_t heartbeats_sent() const { return heartbeat_.beats_sent(); }
    const std::string& id() const { return id_; }

private:
    void mark_complete();
    void on_cancelled(const std::string& reason);
    void finish();

    std::string id_;
    UpstreamRequest request_;
    std::shared_ptr<StreamPipe> pipe_;

    std::atomic<bool> complete_{false};
    std::atomic<State> state_{State::Open};

    HeartbeatEmitter heartbeat_;

    std::mutex thread_mutex_;
    std::thread invoker_thread_;
};
