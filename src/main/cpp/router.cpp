#include "router.h"
#include "utils.h"

Router::Router(const ProxyConfig& config, KeepAliveProxy& keepalive, PassthroughProxy& passthrough)
    : keepalive_enabled_(config.keepalive_enabled), keepalive_(keepalive), passthrough_(passthrough) {}

void Router::handle_options(httplib::Response& res) {
    Utils::apply_cors_headers(res);
    res.set_header("Connection", "keep-alive");
    res.status = 204; // No Content
}

void Router::handle(const httplib::Request& req, httplib::Response& res) {
    if (req.method == "OPTIONS") {
        handle_options(res);
        return;
    }

    if (keepalive_enabled_ && Utils::is_streaming_path(Utils::raw_path(req))) {
        keepalive_.handle(req, res);
    } else {
        passthrough_.handle(req, res);
    }
    Utils::apply_cors_headers(res);
}

void Router::install(httplib::Server& server) {
    auto handler = [this](const httplib::Request& req, httplib::Response& res) {
        handle(req, res);
    };
    server.Get(".*", handler);
    server.Post(".*", handler);
    server.Put(".*", handler);
    server.Patch(".*", handler);
    server.Delete(".*", handler);
    server.Options(".*", handler);
}
