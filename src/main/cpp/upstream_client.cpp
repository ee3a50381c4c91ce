#include "upstream_client.h"
#include "utils.h"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>

static std::once_flag g_curl_init_flag;

static void ensure_curl_global_init() {
    std::call_once(g_curl_init_flag, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

namespace {

// 不向上游转发的请求头（httplib 会把 REMOTE_ADDR 等塞进 headers）
const char* const kSkippedRequestHeaders[] = {
    "Host", "Content-Length", "Connection", "Keep-Alive", "Proxy-Connection",
    "Transfer-Encoding", "TE", "Trailer", "Upgrade", "Accept-Encoding", "Expect",
    "REMOTE_ADDR", "REMOTE_PORT", "LOCAL_ADDR", "LOCAL_PORT",
};

// 不回传给客户端的上游响应头；curl 已解压，Content-Encoding 不再成立
const char* const kSkippedResponseHeaders[] = {
    "Connection", "Keep-Alive", "Proxy-Connection", "Transfer-Encoding", "Trailer", "Upgrade",
    "Content-Length", "Content-Encoding", "Content-Type",
};

template <size_t N>
bool is_listed(const std::string& name, const char* const (&list)[N]) {
    for (const char* entry : list) {
        if (Utils::iequals(name, entry)) return true;
    }
    return false;
}

std::string trim_crlf(const std::string& s) {
    auto l = s.find_first_not_of(" \t");
    if (l == std::string::npos) return "";
    auto r = s.find_last_not_of(" \t\r\n");
    if (r == std::string::npos || r < l) return "";
    return s.substr(l, r - l + 1);
}

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

struct TransferCtx {
    CURL* curl = nullptr;
    UpstreamResponseHead head;
    bool head_delivered = false;
    bool aborted_by_handler = false;
    std::exception_ptr error;

    UpstreamClient::HeadHandler* on_head = nullptr;
    UpstreamClient::ChunkHandler* on_chunk = nullptr;
    UpstreamClient::AbortCheck* should_abort = nullptr;
};

bool deliver_head(TransferCtx* ctx) {
    if (ctx->head_delivered) return true;
    ctx->head_delivered = true;

    long code = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &code);
    ctx->head.status = code;
    return !*ctx->on_head || (*ctx->on_head)(ctx->head);
}

size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t n = size * nitems;
    auto* ctx = static_cast<TransferCtx*>(userdata);

    std::string line(buffer, buffer + n);
    if (line.rfind("HTTP/", 0) == 0) {
        // 新的状态行（重定向或 100 Continue 之后）：丢弃之前的头
        ctx->head.headers.clear();
        ctx->head.reason.clear();
        auto sp1 = line.find(' ');
        auto sp2 = sp1 == std::string::npos ? std::string::npos : line.find(' ', sp1 + 1);
        if (sp2 != std::string::npos) {
            ctx->head.reason = trim_crlf(line.substr(sp2 + 1));
        }
        return n;
    }

    auto colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = trim_crlf(line.substr(0, colon));
        std::string value = trim_crlf(line.substr(colon + 1));
        if (!name.empty()) {
            ctx->head.headers.emplace(name, value);
        }
    }
    return n;
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t n = size * nmemb;
    auto* ctx = static_cast<TransferCtx*>(userdata);
    try {
        if (!deliver_head(ctx)) {
            ctx->aborted_by_handler = true;
            return 0;
        }
        if (n > 0 && *ctx->on_chunk && !(*ctx->on_chunk)(ptr, n)) {
            ctx->aborted_by_handler = true;
            return 0;
        }
    } catch (...) {
        // 异常不能穿过 C 回调，perform() 结束后重新抛出
        ctx->error = std::current_exception();
        return 0;
    }
    return n;
}

int xferinfo_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<TransferCtx*>(userdata);
    if (ctx->should_abort && *ctx->should_abort && (*ctx->should_abort)()) {
        ctx->aborted_by_handler = true;
        return 1;
    }
    return 0;
}

}  // namespace

std::string UpstreamResponseHead::content_type() const {
    auto it = headers.find("Content-Type");
    return it == headers.end() ? std::string() : it->second;
}

bool UpstreamResponseHead::is_event_stream() const {
    std::string ct = content_type();
    std::transform(ct.begin(), ct.end(), ct.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return ct.find("text/event-stream") != std::string::npos;
}

UpstreamClient::UpstreamClient() {
    ensure_curl_global_init();
}

UpstreamResponseHead UpstreamClient::perform(const UpstreamRequest& request,
                                             HeadHandler on_head,
                                             ChunkHandler on_chunk,
                                             AbortCheck should_abort) {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        throw std::runtime_error("CURL初始化失败");
    }

    std::unique_ptr<curl_slist, SlistDeleter> headers;
    auto append_header = [&headers](const std::string& line) {
        curl_slist* next = curl_slist_append(headers.get(), line.c_str());
        if (!next) throw std::runtime_error("curl_slist_append failed");
        headers.release();
        headers.reset(next);
    };

    bool has_content_type = false;
    for (const auto& h : request.headers) {
        if (Utils::iequals(h.first, "Content-Type")) has_content_type = true;
        append_header(h.first + ": " + h.second);
    }
    // 关闭 100-continue；没有 Content-Type 时不让 curl 自动补 form 类型
    append_header("Expect:");

    TransferCtx ctx;
    ctx.curl = curl.get();
    ctx.on_head = &on_head;
    ctx.on_chunk = &on_chunk;
    ctx.should_abort = &should_abort;

    char errbuf[CURL_ERROR_SIZE];
    errbuf[0] = '\0';

    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTP_VERSION, (long)CURL_HTTP_VERSION_1_1);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);

    // accept gzip and auto-decompress
    curl_easy_setopt(h, CURLOPT_ACCEPT_ENCODING, "");

    const std::string& method = request.method;
    bool sends_body = !request.body.empty() || method == "POST" || method == "PUT" || method == "PATCH";
    if (sends_body) {
        if (!has_content_type) append_header("Content-Type:");
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, (curl_off_t)request.body.size());
        if (method != "POST") {
            curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, method.c_str());
        }
    } else if (method == "HEAD") {
        curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
    } else if (method == "GET") {
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    } else {
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, method.c_str());
    }
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());

    if (request.timeout_sec > 0) {
        curl_easy_setopt(h, CURLOPT_TIMEOUT, request.timeout_sec);
    }

    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, header_cb);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &ctx);

    if (should_abort) {
        curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        curl_easy_setopt(h, CURLOPT_XFERINFODATA, &ctx);
    }

    Utils::log_debug("upstream " + method + " " + request.url);
    CURLcode rc = curl_easy_perform(h);

    if (ctx.error) {
        std::rethrow_exception(ctx.error);
    }
    if (rc != CURLE_OK) {
        if (ctx.aborted_by_handler) {
            throw std::runtime_error("upstream transfer aborted");
        }
        std::string msg = std::string("curl failed: ") + curl_easy_strerror(rc);
        if (errbuf[0] != '\0') {
            msg += std::string(" | ") + errbuf;
        }
        throw std::runtime_error(msg);
    }

    // 无响应体时（204、HEAD 等）在这里补发头部回调
    if (!deliver_head(&ctx)) {
        throw std::runtime_error("upstream transfer aborted");
    }
    return ctx.head;
}

UpstreamRequest build_upstream_request(const httplib::Request& req,
                                       const ProxyConfig& config,
                                       bool non_streaming) {
    // 与 Router 相同：使用未解码的 target，"%3A" 不视为 ':'
    const std::string& target = req.target.empty() ? req.path : req.target;
    auto parts = Utils::split_target(target);

    std::string path = parts.first;
    if (non_streaming) {
        path = Utils::to_non_streaming_path(path);
    }

    UpstreamRequest out;
    out.method = req.method;
    out.url = Utils::build_target_url(path, Utils::parse_query(parts.second),
                                      config.upstream_host, config.upstream_scheme);
    for (const auto& h : req.headers) {
        if (!is_listed(h.first, kSkippedRequestHeaders)) {
            out.headers.emplace(h.first, h.second);
        }
    }
    // 请求体已由 httplib 完整读入，这里复制一份
    out.body = req.body;
    out.timeout_sec = config.upstream_timeout_sec;
    return out;
}

void copy_response_headers(const httplib::Headers& from, httplib::Response& to) {
    for (const auto& h : from) {
        if (!is_listed(h.first, kSkippedResponseHeaders)) {
            to.set_header(h.first, h.second);
        }
    }
}
