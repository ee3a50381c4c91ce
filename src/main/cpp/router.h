#pragma once

#include <httplib.h>
#include "config.h"
#include "keepalive_proxy.h"
#include "passthrough_proxy.h"

// 按方法与路径分发：OPTIONS -> 预检；:streamGenerateContent（开启保活时）-> KeepAliveProxy；其余 -> PassthroughProxy
class Router {
public:
    Router(const ProxyConfig& config, KeepAliveProxy& keepalive, PassthroughProxy& passthrough);

    void handle(const httplib::Request& req, httplib::Response& res);

    // 注册为所有方法、所有路径的处理器
    void install(httplib::Server& server);

    static void handle_options(httplib::Response& res);

private:
    bool keepalive_enabled_;
    KeepAliveProxy& keepalive_;
    PassthroughProxy& passthrough_;
};
