#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <httplib.h>

// 输出流：生产者（心跳 / 上游调用）追加整帧，连接线程取出写到 socket。
// 只允许 close 一次；close / cancel 之后 write 返回 false，不抛异常。
class StreamPipe {
public:
    enum class ReadStatus {
        Data,       // out 中有数据
        Timeout,    // 超时内无数据，流仍打开
        Closed,     // 已正常关闭且数据已取完
        Cancelled   // 客户端断开
    };

    using CancelCallback = std::function<void(const std::string& reason)>;

    StreamPipe() = default;
    StreamPipe(const StreamPipe&) = delete;
    StreamPipe& operator=(const StreamPipe&) = delete;

    // 追加一帧（整帧原子写入）
    bool write(const std::string& chunk);
    bool write(const char* data, size_t len);

    // 正常关闭；重复关闭返回 false
    bool close();

    // 客户端断开；丢弃未发送数据，回调只触发一次
    void cancel(const std::string& reason);

    // 断开时的回调（在调用 cancel 的线程上执行，不持锁）
    void on_cancel(CancelCallback callback);

    // 取出当前所有排队数据
    ReadStatus read(std::string& out, std::chrono::milliseconds timeout);

    // httplib chunked content provider 的一次调用
    bool drain_to(httplib::DataSink& sink, std::chrono::milliseconds poll = std::chrono::milliseconds(200));

    bool is_closed() const;
    bool is_cancelled() const;
    size_t bytes_written() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> chunks_;
    bool closed_ = false;
    bool cancelled_ = false;
    size_t bytes_written_ = 0;
    CancelCallback on_cancel_;
};
