#include "passthrough_proxy.h"
#include "stream_pipe.h"
#include "upstream_client.h"
#include "utils.h"
#include <exception>
#include <future>
#include <memory>
#include <thread>

PassthroughProxy::PassthroughProxy(const ProxyConfig& config) : config_(config) {}

void PassthroughProxy::handle(const httplib::Request& req, httplib::Response& res) {
    auto upstream = std::make_shared<UpstreamRequest>(build_upstream_request(req, config_, false));
    auto pipe = std::make_shared<StreamPipe>();
    auto head_promise = std::make_shared<std::promise<UpstreamResponseHead>>();
    std::future<UpstreamResponseHead> head_future = head_promise->get_future();

    auto worker = std::make_shared<std::thread>([upstream, pipe, head_promise]() {
        bool head_sent = false;
        try {
            UpstreamClient client;
            client.perform(
                *upstream,
                [&](const UpstreamResponseHead& head) {
                    head_promise->set_value(head);
                    head_sent = true;
                    return true;
                },
                [&](const char* data, size_t len) {
                    return pipe->write(data, len);
                },
                [&]() { return pipe->is_cancelled(); });
        } catch (const std::exception& e) {
            if (!head_sent) {
                head_promise->set_exception(std::current_exception());
            } else if (!pipe->is_cancelled()) {
                Utils::log_warn("pass-through body truncated: " + std::string(e.what()));
            }
        }
        if (!pipe->close()) {
            Utils::log_debug("pass-through stream already closed");
        }
    });

    UpstreamResponseHead head;
    try {
        head = head_future.get();
    } catch (const std::exception& e) {
        worker->join();
        Utils::log_error("pass-through " + req.method + " " + req.path + " failed: " + e.what());
        Utils::send_error(res, "Upstream request failed", e.what(), 502);
        return;
    }

    try {
        res.status = (int)head.status;
        if (!head.reason.empty()) {
            res.reason = head.reason;
        }
        copy_response_headers(head.headers, res);

        bool has_body = req.method != "HEAD" && head.status != 204 && head.status != 304 && head.status >= 200;
        if (!has_body) {
            worker->join();
            return;
        }

        std::string content_type = head.content_type();
        if (content_type.empty()) {
            content_type = "application/octet-stream";
        }
        res.set_chunked_content_provider(
            content_type,
            [pipe](size_t /*offset*/, httplib::DataSink& sink) {
                return pipe->drain_to(sink);
            },
            [pipe, worker](bool success) {
                if (!success) {
                    pipe->cancel("client disconnected");
                }
                if (worker->joinable()) {
                    worker->join();
                }
            });
    } catch (const std::exception&) {
        pipe->cancel("response setup failed");
        if (worker->joinable()) worker->join();
        throw;
    }
}
