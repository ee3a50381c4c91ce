#include "event_frames.h"

using json = nlohmann::json;

namespace EventFrames {

const char* const kDoneFrame = "data: [DONE]\n\n";

std::string build_data_frame(const json& payload) {
    // 上游错误体可能不是合法 UTF-8
    return "data: " + payload.dump(-1, ' ', false, json::error_handler_t::replace) + "\n\n";
}

json build_heartbeat_payload() {
    json part;
    part["text"] = "\n\n";

    json content;
    content["parts"] = json::array({part});
    content["role"] = "model";

    json candidate;
    candidate["content"] = content;
    candidate["finishReason"] = "STOP";
    candidate["index"] = 0;
    candidate["safetyRatings"] = json::array();

    json usage;
    usage["promptTokenCount"] = 0;
    usage["candidatesTokenCount"] = 0;
    usage["totalTokenCount"] = 0;

    json response;
    response["candidates"] = json::array({candidate});
    response["usageMetadata"] = usage;
    return response;
}

std::string build_heartbeat_frame() {
    static const std::string frame = build_data_frame(build_heartbeat_payload());
    return frame;
}

std::string build_upstream_error_frame(long status, const std::string& reason, const std::string& body) {
    std::string message = "API Error: " + std::to_string(status);
    if (!reason.empty()) {
        message += " " + reason;
    }

    json error;
    error["message"] = message;
    error["details"] = body;

    json payload;
    payload["error"] = error;
    return build_data_frame(payload);
}

std::string build_internal_error_frame(const std::string& detail) {
    json error;
    error["message"] = "Proxy internal error";
    error["details"] = detail;

    json payload;
    payload["error"] = error;
    return build_data_frame(payload);
}

}  // namespace EventFrames
