#pragma once

#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include <httplib.h>

// 查询参数（保持原始顺序，允许重复）
using QueryParams = std::vector<std::pair<std::string, std::string>>;

namespace Utils {
    // 上游凭据参数名
    extern const char* const kKeyParam;

    // 发送错误响应
    void send_error(httplib::Response& res, const std::string& message, int http_code);
    void send_error(httplib::Response& res, const std::string& message, const std::string& detail, int http_code);

    // 覆盖式写入 CORS 头
    void apply_cors_headers(httplib::Response& res);

    // 日志
    void set_verbose(bool verbose);
    bool is_verbose();
    void log_debug(const std::string& message);
    void log_info(const std::string& message);
    void log_warn(const std::string& message);
    void log_error(const std::string& message);

    // 多个逗号分隔的 key 时随机选取一个；否则原样返回
    std::string select_api_key(const std::string& raw);

    // 解析 / 序列化 application/x-www-form-urlencoded 查询串
    QueryParams parse_query(const std::string& query);
    std::string encode_query(const QueryParams& params);
    std::string form_encode(const std::string& value);
    std::string form_decode(const std::string& value);

    // 拼接上游 URL：{scheme}://{host}{path}?{params}。
    // 第一个 key 参数含多个凭据时替换为选中的那个，并去掉其余 key 参数
    std::string build_target_url(const std::string& path,
                                 const QueryParams& params,
                                 const std::string& host,
                                 const std::string& scheme = "https");

    // ":streamGenerateContent" -> ":generateContent"
    std::string to_non_streaming_path(const std::string& path);
    bool is_streaming_path(const std::string& path);

    // 拆分 request target 为 path 与 query
    std::pair<std::string, std::string> split_target(const std::string& target);

    // 未解码的请求路径（不含 query）；路由判断与上游改写都用它
    std::string raw_path(const httplib::Request& req);

    // 大小写不敏感比较
    bool iequals(const std::string& a, const std::string& b);

    // UUID生成
    std::string generate_uuid();
}
