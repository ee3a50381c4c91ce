#include "upstream_invoker.h"
#include "event_frames.h"
#include "utils.h"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

UpstreamInvoker::UpstreamInvoker(const UpstreamRequest& request,
                                 std::shared_ptr<StreamPipe> pipe,
                                 CompletionHook on_complete,
                                 std::string session_id)
    : request_(request),
      pipe_(std::move(pipe)),
      on_complete_(std::move(on_complete)),
      session_id_(std::move(session_id)) {}

std::string UpstreamInvoker::tag() const {
    return session_id_.empty() ? std::string() : "[" + session_id_ + "] ";
}

void UpstreamInvoker::write_frame(const std::string& frame) {
    if (!pipe_->write(frame)) {
        throw std::runtime_error("output stream is closed");
    }
}

void UpstreamInvoker::run() {
    try {
        UpstreamClient client;
        bool relay = false;
        std::string buffered;

        UpstreamResponseHead head = client.perform(
            request_,
            [&](const UpstreamResponseHead& h) {
                on_complete_();
                relay = h.is_success() && h.is_event_stream();
                Utils::log_debug(tag() + "upstream responded " + std::to_string(h.status)
                                 + " content-type=" + h.content_type());
                return true;
            },
            [&](const char* data, size_t len) {
                if (relay) {
                    return pipe_->write(data, len);
                }
                buffered.append(data, len);
                return true;
            },
            [this] { return pipe_->is_cancelled(); });

        on_complete_();

        if (!head.is_success()) {
            Utils::log_warn(tag() + "upstream error " + std::to_string(head.status) + " " + head.reason);
            write_frame(EventFrames::build_upstream_error_frame(head.status, head.reason, buffered));
        } else if (!relay) {
            json data = json::parse(buffered);
            write_frame(EventFrames::build_data_frame(data));
        }

        write_frame(EventFrames::kDoneFrame);
    } catch (const std::exception& e) {
        on_complete_();
        if (pipe_->is_cancelled()) {
            Utils::log_info(tag() + "client gone, upstream result discarded (" + e.what() + ")");
        } else {
            Utils::log_error(tag() + "keepalive upstream call failed: " + e.what());
            if (!pipe_->write(EventFrames::build_internal_error_frame(e.what()))
                || !pipe_->write(EventFrames::kDoneFrame)) {
                Utils::log_debug(tag() + "output stream closed before error frame");
            }
        }
    }

    if (!pipe_->close()) {
        Utils::log_debug(tag() + "output stream already closed");
    }
}
