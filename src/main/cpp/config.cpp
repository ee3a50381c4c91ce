#include "config.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

long parse_number(const std::string& option, const std::string& value, long min, long max) {
    size_t consumed = 0;
    long n = 0;
    try {
        n = std::stol(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(option + " must be a number");
    }
    if (consumed != value.size()) {
        throw std::invalid_argument(option + " must be a number");
    }
    if (n < min || n > max) {
        throw std::invalid_argument(option + " must be between " + std::to_string(min) + " and " + std::to_string(max));
    }
    return n;
}

}  // namespace

void printHelp() {
    std::cout << "Usage: gemini-keepalive-proxy [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -h, --help                     Display this help message" << std::endl;
    std::cout << "  -p, --port <number>            Listen port (default: 8080, next free port is tried when busy)" << std::endl;
    std::cout << "  -b, --bind <address>           Listen address (default: 0.0.0.0)" << std::endl;
    std::cout << "  -k, --keepalive <true|false>   Heartbeat stream adaptation (default: true, env KEEPALIVE)" << std::endl;
    std::cout << "  -i, --heartbeat-interval <ms>  Heartbeat period in milliseconds (default: 2000)" << std::endl;
    std::cout << "  -u, --upstream-host <host>     Upstream host[:port] (default: generativelanguage.googleapis.com)" << std::endl;
    std::cout << "      --upstream-scheme <s>      http or https (default: https)" << std::endl;
    std::cout << "  -t, --upstream-timeout <sec>   Upstream call timeout, 0 = none (default: 0)" << std::endl;
    std::cout << "      --threads <number>         Worker threads (default: 32)" << std::endl;
    std::cout << "      --ssl-cert <file>          Serve HTTPS with this certificate" << std::endl;
    std::cout << "      --ssl-key <file>           Private key for --ssl-cert" << std::endl;
    std::cout << "  -v, --verbose                  Print debug logs" << std::endl;
    std::cout << std::endl;
    std::cout << "Requests whose path ends with :streamGenerateContent are answered with an" << std::endl;
    std::cout << "event stream that carries heartbeats until the upstream result is ready." << std::endl;
    std::cout << "All other requests are forwarded unchanged." << std::endl;
}

bool parseBool(const std::string& value) {
    std::string v = to_lower(value);
    if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    throw std::invalid_argument("invalid boolean value: " + value);
}

void applyEnvironment(ProxyConfig& config) {
    const char* keepalive = std::getenv("KEEPALIVE");
    if (keepalive) {
        config.keepalive_enabled = std::string(keepalive) != "false";
    }
}

ProxyConfig parseArgs(int argc, char* argv[]) {
    ProxyConfig config;
    applyEnvironment(config);

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto next_value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument("missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            config.show_help = true;
        } else if (arg == "-p" || arg == "--port") {
            config.port = (int)parse_number(arg, next_value(), 0, 65535);
        } else if (arg == "-b" || arg == "--bind") {
            config.bind_address = next_value();
        } else if (arg == "-k" || arg == "--keepalive") {
            config.keepalive_enabled = parseBool(next_value());
        } else if (arg == "-i" || arg == "--heartbeat-interval") {
            config.heartbeat_interval = std::chrono::milliseconds(parse_number(arg, next_value(), 1, 3600000));
        } else if (arg == "-u" || arg == "--upstream-host") {
            config.upstream_host = next_value();
            if (config.upstream_host.empty()) {
                throw std::invalid_argument("upstream host must not be empty");
            }
        } else if (arg == "--upstream-scheme") {
            std::string scheme = to_lower(next_value());
            if (scheme != "http" && scheme != "https") {
                throw std::invalid_argument("unsupported upstream scheme: " + scheme);
            }
            config.upstream_scheme = scheme;
        } else if (arg == "-t" || arg == "--upstream-timeout") {
            config.upstream_timeout_sec = parse_number(arg, next_value(), 0, 86400);
        } else if (arg == "--threads") {
            config.threads = (int)parse_number(arg, next_value(), 1, 4096);
        } else if (arg == "--ssl-cert") {
            config.ssl_cert = next_value();
        } else if (arg == "--ssl-key") {
            config.ssl_key = next_value();
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else {
            throw std::invalid_argument("unknown option: " + arg);
        }
    }

    if (config.ssl_cert.empty() != config.ssl_key.empty()) {
        throw std::invalid_argument("--ssl-cert and --ssl-key must be given together");
    }
    return config;
}
