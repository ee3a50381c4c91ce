#include "stream_adapter.h"
#include "upstream_invoker.h"
#include "utils.h"

StreamAdapter::StreamAdapter(UpstreamRequest request,
                             std::chrono::milliseconds heartbeat_interval,
                             std::string id)
    : id_(std::move(id)),
      request_(std::move(request)),
      pipe_(std::make_shared<StreamPipe>()),
      heartbeat_(pipe_, heartbeat_interval, [this] { return complete_.load(); }) {}

StreamAdapter::~StreamAdapter() {
    heartbeat_.stop();

    std::lock_guard<std::mutex> lock(thread_mutex_);
    if (invoker_thread_.joinable()) {
        // 最后一个引用可能在后台线程自身上释放
        if (invoker_thread_.get_id() == std::this_thread::get_id()) {
            invoker_thread_.detach();
        } else {
            invoker_thread_.join();
        }
    }
}

bool StreamAdapter::start(std::function<void()> on_finished) {
    State expected = State::Open;
    if (!state_.compare_exchange_strong(expected, State::Streaming)) {
        return false;
    }

    std::weak_ptr<StreamAdapter> weak = shared_from_this();
    pipe_->on_cancel([weak](const std::string& reason) {
        if (auto self = weak.lock()) {
            self->on_cancelled(reason);
        }
    });

    heartbeat_.start();

    auto self = shared_from_this();
    std::lock_guard<std::mutex> lock(thread_mutex_);
    invoker_thread_ = std::thread([self, on_finished]() {
        UpstreamInvoker invoker(self->request_, self->pipe_, [self]() { self->mark_complete(); }, self->id_);
        invoker.run();
        self->finish();
        if (on_finished) {
            on_finished();
        }
    });
    return true;
}

void StreamAdapter::cancel(const std::string& reason) {
    pipe_->cancel(reason);
    on_cancelled(reason);
}

void StreamAdapter::join() {
    std::lock_guard<std::mutex> lock(thread_mutex_);
    if (invoker_thread_.joinable() && invoker_thread_.get_id() != std::this_thread::get_id()) {
        invoker_thread_.join();
    }
}

// 标志必须先于任何终止帧置位；stop() 会等待正在写的心跳结束
void StreamAdapter::mark_complete() {
    bool first = false;
    heartbeat_.exclusive([this, &first] { first = !complete_.exchange(true); });
    if (first) {
        Utils::log_debug("[" + id_ + "] upstream settled after " + std::to_string(heartbeat_.beats_sent()) + " heartbeat(s)");
    }
    heartbeat_.stop();
}

void StreamAdapter::on_cancelled(const std::string& reason) {
    mark_complete();
    if (state_.exchange(State::Done) != State::Done) {
        Utils::log_info("[" + id_ + "] client disconnected: " + reason);
    }
}

void StreamAdapter::finish() {
    if (state_.exchange(State::Done) != State::Done) {
        Utils::log_debug("[" + id_ + "] stream finished, " + std::to_string(heartbeat_.beats_sent())
                         + " heartbeat(s), " + std::to_string(pipe_->bytes_written()) + " bytes");
    }
}
