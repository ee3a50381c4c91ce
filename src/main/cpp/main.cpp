/***********************
 * main.cpp
 ***********************/

#include <cstdlib>
#include <iostream>
#include <string>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <memory>
#include <stdexcept>

 // 第三方库
#include <httplib.h>        // https://github.com/yhirose/cpp-httplib
#include <curl/curl.h>      // libcurl

#include "config.h"
#include "keepalive_proxy.h"
#include "passthrough_proxy.h"
#include "router.h"
#include "shutdown_signal.h"
#include "utils.h"

// --------------------------------------------------------------------------
// 日志记录函数
// --------------------------------------------------------------------------
void logResponse(const std::string& method, const std::string& endpoint, int status,
                 const std::string& httpVersion, const std::string& remoteIP, int remotePort) {
    // 根据状态码设置颜色
    std::string colorCode;
    if (status >= 200 && status < 400) {
        colorCode = "\033[32m";  // 绿色
    } else if (status >= 400) {
        colorCode = "\033[31m";  // 红色
    } else {
        colorCode = "\033[0m";   // 默认
    }

    std::stringstream line;
    line << remoteIP << ":" << remotePort << " "
         << method << " " << endpoint << " " << httpVersion << " "
         << colorCode << status << "\033[0m";
    Utils::log_info(line.str());
}

// --------------------------------------------------------------------------
// main 函数
// --------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    ProxyConfig config;
    try {
        config = parseArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        printHelp();
        return 1;
    }
    if (config.show_help) {
        printHelp();
        return 0;
    }

    Utils::set_verbose(config.verbose);

    try {
        // 初始化 curl
        curl_global_init(CURL_GLOBAL_ALL);

        std::unique_ptr<httplib::Server> server;
        if (config.use_ssl()) {
            server = std::make_unique<httplib::SSLServer>(config.ssl_cert.c_str(), config.ssl_key.c_str());
        } else {
            server = std::make_unique<httplib::Server>();
        }
        if (!server->is_valid()) {
            std::cerr << "Failed to initialize server (check --ssl-cert / --ssl-key)" << std::endl;
            curl_global_cleanup();
            return 1;
        }

        KeepAliveProxy keepalive(config);
        PassthroughProxy passthrough(config);
        Router router(config, keepalive, passthrough);

        // 设置服务器参数
        server->set_read_timeout(60, 0);    // 60 seconds
        server->set_write_timeout(60, 0);   // 60 seconds
        server->set_idle_interval(0, 100000); // 100ms
        server->set_payload_max_length(1024 * 1024 * 100); // 100MB max
        const size_t threads = static_cast<size_t>(config.threads);
        server->new_task_queue = [threads] { return new httplib::ThreadPool(threads); };

        server->set_logger([](const httplib::Request& req, const httplib::Response& res) {
            logResponse(req.method, req.path, res.status, req.version, req.remote_addr, req.remote_port);
        });

        router.install(*server);

        // 端口被占用时依次尝试下一个
        int bound_port = -1;
        for (int port = config.port; port <= 65535; port++) {
            if (server->bind_to_port(config.bind_address, port)) {
                bound_port = port;
                break;
            }
            std::cout << "Port " << port << " is busy, trying next port..." << std::endl;
        }
        if (bound_port < 0) {
            std::cerr << "No available ports found!" << std::endl;
            curl_global_cleanup();
            return 1;
        }

        std::cout << "Listening on " << (config.use_ssl() ? "https://" : "http://")
                  << config.bind_address << ":" << bound_port << std::endl;
        std::cout << "Upstream: " << config.upstream_scheme << "://" << config.upstream_host << std::endl;
        std::cout << "Keepalive: " << (config.keepalive_enabled ? "enabled" : "disabled")
                  << ", heartbeat every " << config.heartbeat_interval.count() << " ms" << std::endl;

        // 端口绑定后再注册信号，stop() 才能关掉监听 socket
        httplib::Server* srv = server.get();
        ShutdownSignal shutdown([srv] { srv->stop(); });
        shutdown.install();

        // 开始监听（阻塞）
        if (!server->listen_after_bind()) {
            std::cerr << "Failed to listen on port " << bound_port << std::endl;
        }
        shutdown.stop();

        std::cout << "Shutting down..." << std::endl;
        if (!keepalive.wait_idle(std::chrono::seconds(5))) {
            Utils::log_warn(std::to_string(keepalive.active_sessions()) + " keepalive session(s) still running at exit");
        }

        // 清理
        curl_global_cleanup();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        curl_global_cleanup();
        return 1;
    }
}
