#pragma once

#include <functional>
#include <memory>
#include <string>
#include "stream_pipe.h"
#include "upstream_client.h"

// 对上游做且仅做一次调用，并把结果写入输出流：
//   非 2xx            -> 一帧错误（状态码 + 原始响应体）
//   2xx event-stream  -> 原样逐块转发
//   2xx 其他          -> 解析 JSON，包装成一帧
// 之后写 [DONE]，最后关闭输出流。任何异常都转成内部错误帧 + [DONE]。
class UpstreamInvoker {
public:
    // 上游有结果（或失败）时调用，必须先于任何终止帧
    using CompletionHook = std::function<void()>;

    UpstreamInvoker(const UpstreamRequest& request,
                    std::shared_ptr<StreamPipe> pipe,
                    CompletionHook on_complete,
                    std::string session_id = "");

    void run();

private:
    void write_frame(const std::string& frame);
    std::string tag() const;

    const UpstreamRequest& request_;
    std::shared_ptr<StreamPipe> pipe_;
    CompletionHook on_complete_;
    std::string session_id_;
};
