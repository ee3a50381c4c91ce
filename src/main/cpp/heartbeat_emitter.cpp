#include "heartbeat_emitter.h"
#include "event_frames.h"
#include "utils.h"

HeartbeatEmitter::HeartbeatEmitter(std::shared_ptr<StreamPipe> pipe,
                                   std::chrono::milliseconds interval,
                                   std::function<bool()> is_complete)
    : pipe_(std::move(pipe)), interval_(interval), is_complete_(std::move(is_complete)) {}

HeartbeatEmitter::~HeartbeatEmitter() {
    stop();
}

bool HeartbeatEmitter::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_ || stop_requested_) {
        return false;
    }
    started_ = true;

    std::lock_guard<std::mutex> join_lock(join_mutex_);
    thread_ = std::thread(&HeartbeatEmitter::run, this);
    return true;
}

void HeartbeatEmitter::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();

    std::lock_guard<std::mutex> join_lock(join_mutex_);
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
    stopped_.store(true);
}

void HeartbeatEmitter::exclusive(const std::function<void()>& fn) {
    std::lock_guard<std::mutex> tick(tick_mutex_);
    fn();
}

void HeartbeatEmitter::run() {
    const std::string frame = EventFrames::build_heartbeat_frame();

    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
            break;
        }
        lock.unlock();

        bool ok = true;
        {
            std::lock_guard<std::mutex> tick(tick_mutex_);
            if (!is_complete_()) {
                ok = pipe_->write(frame);
                if (ok) {
                    beats_.fetch_add(1);
                }
            }
        }

        lock.lock();
        if (!ok) {
            // 客户端已断开或流正在收尾，不上报
            Utils::log_debug("heartbeat write failed, stopping timer");
            stop_requested_ = true;
        }
    }
    stopped_.store(true);
}
