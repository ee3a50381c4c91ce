#pragma once

#include <httplib.h>
#include "config.h"

// 普通转发：状态码、响应头、响应体原样返回（响应体边收边发）
class PassthroughProxy {
public:
    explicit PassthroughProxy(const ProxyConfig& config);

    void handle(const httplib::Request& req, httplib::Response& res);

private:
    ProxyConfig config_;
};
