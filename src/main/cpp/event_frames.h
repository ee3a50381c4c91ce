#pragma once

#include <string>
#include <nlohmann/json.hpp>

// SSE 帧构建：每帧为 "data: <payload>\n\n"
namespace EventFrames {
    extern const char* const kDoneFrame;  // "data: [DONE]\n\n"

    std::string build_data_frame(const nlohmann::json& payload);

    // 心跳：空文本候选 + STOP + 全零 usage，客户端会忽略
    nlohmann::json build_heartbeat_payload();
    std::string build_heartbeat_frame();

    // 上游非 2xx
    std::string build_upstream_error_frame(long status, const std::string& reason, const std::string& body);

    // 代理内部错误（网络、解析、写入失败）
    std::string build_internal_error_frame(const std::string& detail);
}
