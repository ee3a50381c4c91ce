#pragma once

#include <functional>
#include <string>
#include <httplib.h>
#include "config.h"

// 发往上游的请求
struct UpstreamRequest {
    std::string method = "GET";
    std::string url;
    httplib::Headers headers;
    std::string body;
    long timeout_sec = 0;
};

// 上游响应头部（状态行 + 头）
struct UpstreamResponseHead {
    long status = 0;
    std::string reason;
    httplib::Headers headers;

    bool is_success() const { return status >= 200 && status < 300; }
    std::string content_type() const;
    bool is_event_stream() const;
};

// libcurl 封装：响应头到达后回调一次，随后按块回调响应体。
// 传输失败抛 std::runtime_error；任一回调返回 false 或 should_abort() 为真时中止传输。
class UpstreamClient {
public:
    using HeadHandler = std::function<bool(const UpstreamResponseHead&)>;
    using ChunkHandler = std::function<bool(const char* data, size_t len)>;
    using AbortCheck = std::function<bool()>;

    UpstreamClient();

    UpstreamResponseHead perform(const UpstreamRequest& request,
                                 HeadHandler on_head,
                                 ChunkHandler on_chunk,
                                 AbortCheck should_abort = nullptr);
};

// 由入站请求构造上游请求；non_streaming 为真时改写 ":streamGenerateContent"
UpstreamRequest build_upstream_request(const httplib::Request& req,
                                       const ProxyConfig& config,
                                       bool non_streaming);

// 复制可转发给客户端的上游响应头（去掉逐跳头、长度与编码头）
void copy_response_headers(const httplib::Headers& from, httplib::Response& to);
