#include "keepalive_proxy.h"
#include "stream_adapter.h"
#include "upstream_client.h"
#include "utils.h"
#include <memory>
#include <stdexcept>

KeepAliveProxy::KeepAliveProxy(const ProxyConfig& config) : config_(config) {}

void KeepAliveProxy::handle(const httplib::Request& req, httplib::Response& res) {
    const std::string id = Utils::generate_uuid().substr(0, 8);
    Utils::log_debug("[" + id + "] keepalive stream: " + req.method + " " + req.path);

    auto adapter = std::make_shared<StreamAdapter>(build_upstream_request(req, config_, true),
                                                   config_.heartbeat_interval, id);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++active_;
    }
    try {
        adapter->start([this]() { session_finished(); });
    } catch (const std::exception& e) {
        session_finished();
        Utils::log_error("[" + id + "] failed to start keepalive session: " + e.what());
        Utils::send_error(res, "Proxy internal error", e.what(), 500);
        return;
    }

    res.status = 200;
    res.set_header("Cache-Control", "no-cache");
    res.set_header("Connection", "keep-alive");

    auto pipe = adapter->stream();
    res.set_chunked_content_provider(
        "text/event-stream",
        [pipe](size_t /*offset*/, httplib::DataSink& sink) {
            return pipe->drain_to(sink);
        },
        [adapter](bool success) {
            if (!success) {
                adapter->cancel("connection closed before stream end");
            }
            adapter->join();
        });
}

size_t KeepAliveProxy::active_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

bool KeepAliveProxy::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return active_ == 0; });
}

void KeepAliveProxy::session_finished() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_ > 0) --active_;
    }
    idle_cv_.notify_all();
}
