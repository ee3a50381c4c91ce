#include "utils.h"
#include <nlohmann/json.hpp>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <vector>
#include <atomic>
#include <mutex>
#include <chrono>
#include <ctime>
#include <random>
#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace {

const char* const kStreamingSuffix = ":streamGenerateContent";
const char* const kNonStreamingSuffix = ":generateContent";

std::atomic<bool> g_verbose{false};
std::mutex g_log_mutex;

std::mt19937& rng() {
    thread_local std::mt19937 gen{std::random_device{}()};
    return gen;
}

void write_log(const char* tag, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    std::time_t now_time = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    localtime_r(&now_time, &tm_buf);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cout << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "] "
              << tag << " " << message << std::endl;
}

std::string trim(const std::string& s) {
    auto l = s.find_first_not_of(" \t\r\n\f\v");
    if (l == std::string::npos) return "";
    auto r = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(l, r - l + 1);
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

namespace Utils {

const char* const kKeyParam = "key";

void send_error(httplib::Response& res, const std::string& message, int http_code) {
    json error;
    error["error"] = message;
    res.status = http_code;
    res.set_content(error.dump(), "application/json; charset=utf-8");
}

void send_error(httplib::Response& res, const std::string& message, const std::string& detail, int http_code) {
    json error;
    error["error"] = message;
    error["detail"] = detail;
    res.status = http_code;
    res.set_content(error.dump(), "application/json; charset=utf-8");
}

void apply_cors_headers(httplib::Response& res) {
    static const std::pair<const char*, const char*> kCors[] = {
        {"Access-Control-Allow-Origin", "*"},
        {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
        {"Access-Control-Allow-Headers", "Content-Type, Authorization"},
    };
    for (const auto& h : kCors) {
        res.headers.erase(h.first);
        res.set_header(h.first, h.second);
    }
}

void set_verbose(bool verbose) { g_verbose.store(verbose); }

bool is_verbose() { return g_verbose.load(); }

void log_debug(const std::string& message) {
    if (g_verbose.load()) write_log("[DEBUG]", message);
}

void log_info(const std::string& message) { write_log("[INFO]", message); }

void log_warn(const std::string& message) { write_log("[WARN]", message); }

void log_error(const std::string& message) { write_log("[ERROR]", message); }

std::string select_api_key(const std::string& raw) {
    if (raw.find(',') == std::string::npos) {
        return raw;
    }

    std::vector<std::string> keys;
    std::stringstream ss(raw);
    std::string token;
    while (std::getline(ss, token, ',')) {
        token = trim(token);
        if (!token.empty()) keys.push_back(token);
    }
    if (keys.empty()) {
        return raw;
    }

    std::uniform_int_distribution<size_t> dis(0, keys.size() - 1);
    return keys[dis(rng())];
}

QueryParams parse_query(const std::string& query) {
    QueryParams params;
    std::string q = query;
    if (!q.empty() && q[0] == '?') q.erase(0, 1);

    size_t pos = 0;
    while (pos <= q.size()) {
        size_t amp = q.find('&', pos);
        if (amp == std::string::npos) amp = q.size();
        std::string pair = q.substr(pos, amp - pos);
        if (!pair.empty()) {
            auto eq = pair.find('=');
            if (eq == std::string::npos) {
                params.emplace_back(form_decode(pair), "");
            } else {
                params.emplace_back(form_decode(pair.substr(0, eq)), form_decode(pair.substr(eq + 1)));
            }
        }
        pos = amp + 1;
    }
    return params;
}

std::string encode_query(const QueryParams& params) {
    std::string out;
    for (const auto& p : params) {
        if (!out.empty()) out += '&';
        out += form_encode(p.first);
        out += '=';
        out += form_encode(p.second);
    }
    return out;
}

// application/x-www-form-urlencoded：仅 ALPHA / DIGIT / "*-._" 不转义，空格转为 '+'
std::string form_encode(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '*' || c == '-' || c == '.' || c == '_') {
            out += static_cast<char>(c);
        } else if (c == ' ') {
            out += '+';
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

std::string form_decode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); i++) {
        char c = value[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < value.size()
                   && hex_value(value[i + 1]) >= 0 && hex_value(value[i + 2]) >= 0) {
            out += static_cast<char>(hex_value(value[i + 1]) * 16 + hex_value(value[i + 2]));
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

std::string build_target_url(const std::string& path,
                             const QueryParams& params,
                             const std::string& host,
                             const std::string& scheme) {
    QueryParams resolved = params;
    auto first_key = std::find_if(resolved.begin(), resolved.end(),
                                  [](const std::pair<std::string, std::string>& p) { return p.first == kKeyParam; });
    if (first_key != resolved.end()) {
        std::string chosen = select_api_key(first_key->second);
        if (chosen != first_key->second) {
            first_key->second = chosen;
            auto index = first_key - resolved.begin();
            resolved.erase(std::remove_if(resolved.begin() + index + 1, resolved.end(),
                                          [](const std::pair<std::string, std::string>& p) { return p.first == kKeyParam; }),
                           resolved.end());
        }
    }

    std::string url = scheme + "://" + host + path;
    if (!resolved.empty()) {
        url += "?" + encode_query(resolved);
    }
    return url;
}

std::string to_non_streaming_path(const std::string& path) {
    std::string out = path;
    auto pos = out.find(kStreamingSuffix);
    if (pos != std::string::npos) {
        out.replace(pos, std::char_traits<char>::length(kStreamingSuffix), kNonStreamingSuffix);
    }
    return out;
}

bool is_streaming_path(const std::string& path) {
    const std::string suffix = kStreamingSuffix;
    return path.size() >= suffix.size()
        && path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::pair<std::string, std::string> split_target(const std::string& target) {
    auto q = target.find('?');
    if (q == std::string::npos) return {target, ""};
    return {target.substr(0, q), target.substr(q + 1)};
}

std::string raw_path(const httplib::Request& req) {
    return split_target(req.target.empty() ? req.path : req.target).first;
}

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

// UUID生成
std::string generate_uuid() {
    std::uniform_int_distribution<> dis(0, 15);
    std::uniform_int_distribution<> dis2(8, 11);
    auto& gen = rng();

    std::stringstream ss;
    int i;
    ss << std::hex;
    for (i = 0; i < 8; i++) {
        ss << dis(gen);
    }
    ss << "-";
    for (i = 0; i < 4; i++) {
        ss << dis(gen);
    }
    ss << "-4";
    for (i = 0; i < 3; i++) {
        ss << dis(gen);
    }
    ss << "-";
    ss << dis2(gen);
    for (i = 0; i < 3; i++) {
        ss << dis(gen);
    }
    ss << "-";
    for (i = 0; i < 12; i++) {
        ss << dis(gen);
    }
    return ss.str();
}

}  // namespace Utils
