#pragma once

#include <chrono>
#include <string>

// 运行配置（命令行 + 环境变量）
struct ProxyConfig {
    int port = 8080;
    std::string bind_address = "0.0.0.0";

    std::string upstream_host = "generativelanguage.googleapis.com";
    std::string upstream_scheme = "https";
    long upstream_timeout_sec = 0;  // 0 = 不限制

    bool keepalive_enabled = true;
    std::chrono::milliseconds heartbeat_interval{2000};

    int threads = 32;
    std::string ssl_cert;
    std::string ssl_key;
    bool verbose = false;

    bool show_help = false;

    bool use_ssl() const { return !ssl_cert.empty() && !ssl_key.empty(); }
};

// 打印帮助信息
void printHelp();

// "true"/"false"/"1"/"0"/"yes"/"no"/"on"/"off"，其他值抛 std::invalid_argument
bool parseBool(const std::string& value);

// 读取 KEEPALIVE 环境变量：除 "false" 外均视为开启
void applyEnvironment(ProxyConfig& config);

// 解析命令行参数；非法参数抛 std::invalid_argument
ProxyConfig parseArgs(int argc, char* argv[]);
