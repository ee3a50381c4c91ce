#include "stream_pipe.h"
#include "utils.h"

bool StreamPipe::write(const std::string& chunk) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || cancelled_) {
            return false;
        }
        chunks_.push_back(chunk);
        bytes_written_ += chunk.size();
    }
    cv_.notify_one();
    return true;
}

bool StreamPipe::write(const char* data, size_t len) {
    return write(std::string(data, len));
}

bool StreamPipe::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        closed_ = true;
    }
    cv_.notify_all();
    return true;
}

void StreamPipe::cancel(const std::string& reason) {
    CancelCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_) {
            return;
        }
        cancelled_ = true;
        closed_ = true;
        chunks_.clear();
        callback = std::move(on_cancel_);
    }
    cv_.notify_all();
    Utils::log_debug("stream cancelled: " + reason);

    if (callback) {
        callback(reason);
    }
}

void StreamPipe::on_cancel(CancelCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_cancel_ = std::move(callback);
}

StreamPipe::ReadStatus StreamPipe::read(std::string& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !chunks_.empty() || closed_; });

    if (cancelled_) {
        return ReadStatus::Cancelled;
    }
    if (!chunks_.empty()) {
        while (!chunks_.empty()) {
            out += chunks_.front();
            chunks_.pop_front();
        }
        return ReadStatus::Data;
    }
    return closed_ ? ReadStatus::Closed : ReadStatus::Timeout;
}

bool StreamPipe::drain_to(httplib::DataSink& sink, std::chrono::milliseconds poll) {
    std::string data;
    switch (read(data, poll)) {
    case ReadStatus::Data:
        if (!sink.write(data.data(), data.size())) {
            cancel("client write failed");
            return false;
        }
        return true;
    case ReadStatus::Timeout:
        // 空闲时也要发现客户端断开
        if (sink.is_writable && !sink.is_writable()) {
            cancel("client not writable");
            return false;
        }
        return true;
    case ReadStatus::Closed:
        sink.done();
        return true;
    case ReadStatus::Cancelled:
        return false;
    }
    return false;
}

bool StreamPipe::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool StreamPipe::is_cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

size_t StreamPipe::bytes_written() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bytes_written_;
}
