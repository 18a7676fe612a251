// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/http_session.hpp>
#include <ferry/core/config.hpp>
#include <ferry/version.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace ferry::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

struct HeaderList {
    curl_slist* ptr = nullptr;

    HeaderList() = default;
    ~HeaderList() { if (ptr) curl_slist_free_all(ptr); }

    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;

    void append(const std::string& line) {
        if (auto* next = curl_slist_append(ptr, line.c_str())) {
            ptr = next;
        }
    }
};

// Per-request state shared with the libcurl callbacks
struct TransferContext {
    CURL* curl{nullptr};
    HttpResponse response;
    const ResponseHandler* handler{nullptr};
    std::stop_token stop;
    std::error_code error;
    bool headers_done{false};
};

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

// Fill derived fields once a header block is complete
void finish_headers(TransferContext& ctx) {
    long http_code = 0;
    curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &http_code);

    auto& r = ctx.response;
    r.status_code = static_cast<std::int32_t>(http_code);

    if (auto it = r.headers.find("content-length"); it != r.headers.end()) {
        char* end = nullptr;
        unsigned long long val = std::strtoull(it->second.c_str(), &end, 10);
        if (end == it->second.c_str() + it->second.size() && !it->second.empty()) {
            r.content_length = static_cast<std::uint64_t>(val);
        }
    }
    if (auto it = r.headers.find("content-type"); it != r.headers.end()) {
        r.content_type = it->second;
    }
    if (auto it = r.headers.find("accept-ranges"); it != r.headers.end()) {
        r.accepts_ranges = it->second.find("bytes") != std::string::npos;
    }
    if (r.status_code == 206 || r.headers.contains("content-range")) {
        r.accepts_ranges = true;
    }
    if (auto it = r.headers.find("content-disposition"); it != r.headers.end()) {
        r.filename = parse_content_disposition(it->second);
    }

    ctx.headers_done = true;
}

std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) noexcept {
    std::size_t total = size * nitems;
    auto* ctx = static_cast<TransferContext*>(userdata);

    try {
        std::string_view line(buffer, total);

        // Status line starts a new header block (redirects, 100-continue)
        if (line.starts_with("HTTP/")) {
            ctx->response = HttpResponse{};
            ctx->headers_done = false;
            return total;
        }

        if (line == "\r\n" || line == "\n") {
            long http_code = 0;
            curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &http_code);
            bool interim = http_code < 200 ||
                           (http_code >= 300 && http_code < 400 && ctx->response.headers.contains("location"));
            if (interim) return total;

            finish_headers(*ctx);
            if (ctx->handler && ctx->handler->on_headers) {
                if (auto ec = ctx->handler->on_headers(ctx->response)) {
                    ctx->error = ec;
                    return 0;
                }
            }
            return total;
        }

        auto colon = line.find(':');
        if (colon == std::string_view::npos) return total;

        auto name = line.substr(0, colon);
        auto value = line.substr(colon + 1);
        while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
            value.remove_prefix(1);
        }
        while (!value.empty() && (value.back() == '\r' || value.back() == '\n')) {
            value.remove_suffix(1);
        }

        ctx->response.headers[to_lower(name)] = std::string(value);
        return total;
    } catch (const std::bad_alloc&) {
        return 0;
    }
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    std::size_t bytes = size * nmemb;
    auto* ctx = static_cast<TransferContext*>(userdata);

    if (!ctx->headers_done) {
        finish_headers(*ctx);
    }

    // Error bodies are drained, not delivered
    if (ctx->response.status_code < 200 || ctx->response.status_code >= 300) {
        return bytes;
    }

    if (ctx->handler && ctx->handler->on_data) {
        auto data = std::span<const std::byte>(reinterpret_cast<const std::byte*>(ptr), bytes);
        if (auto ec = ctx->handler->on_data(data)) {
            ctx->error = ec;
            return 0;
        }
    }
    return bytes;
}

int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* ctx = static_cast<TransferContext*>(userdata);
    // Non-zero aborts the transfer
    return ctx->stop.stop_requested() ? 1 : 0;
}

std::error_code curl_to_error(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OK:                  return {};
        case CURLE_ABORTED_BY_CALLBACK: return make_error_code(DownloadErrc::cancelled);
        case CURLE_OPERATION_TIMEDOUT:  return make_error_code(DownloadErrc::timeout);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return make_error_code(DownloadErrc::invalid_url);
        default:                        return make_error_code(DownloadErrc::network_error);
    }
}

void apply_common(CURL* curl, const HttpOptions& options, HeaderList& headers) {
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options.connect_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options.verify_tls ? 2L : 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);

    std::string agent = options.user_agent.empty()
        ? "ferry/" + ferry::version.to_string()
        : options.user_agent;
    curl_easy_setopt(curl, CURLOPT_USERAGENT, agent.c_str());

    // Binary payloads must arrive untransformed
    headers.append("Accept-Encoding: identity");
    if (!options.bearer_token.empty()) {
        headers.append("Authorization: Bearer " + options.bearer_token);
    }
    for (const auto& [name, value] : options.headers) {
        headers.append(name + ": " + value);
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.ptr);
}

} // namespace

//=============================================================================
// HttpSession
//=============================================================================

HttpSession::HttpSession() = default;

HttpSession::HttpSession(HttpOptions options)
    : options_(std::move(options)) {}

HttpSession::~HttpSession() = default;

std::expected<HttpResponse, std::error_code>
HttpSession::head(const std::string& url) noexcept {
    try {
        CurlHandle curl(curl_easy_init());
        if (!curl.ptr) {
            return std::unexpected(make_error_code(DownloadErrc::network_error));
        }

        TransferContext ctx;
        ctx.curl = curl.ptr;
        HeaderList headers;

        curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
        apply_common(curl.ptr, options_, headers);
        curl_easy_setopt(curl.ptr, CURLOPT_TIMEOUT, static_cast<long>(options_.connect_timeout.count() * 2));
        curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &ctx);

        CURLcode result = curl_easy_perform(curl.ptr);
        if (result != CURLE_OK) {
            spdlog::debug("HEAD {} failed: {}", url, curl_easy_strerror(result));
            return std::unexpected(curl_to_error(result));
        }
        if (!ctx.headers_done) {
            finish_headers(ctx);
        }

        if (auto ec = status_to_error(ctx.response.status_code)) {
            spdlog::debug("HEAD {} returned {}", url, ctx.response.status_code);
            return std::unexpected(ec);
        }
        return ctx.response;
    } catch (const std::exception& e) {
        spdlog::error("HEAD {}: {}", url, e.what());
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }
}

std::expected<HttpResponse, std::error_code>
HttpSession::get(const RangeRequest& request,
                 const ResponseHandler& handler,
                 std::stop_token stop) noexcept {
    try {
        CurlHandle curl(curl_easy_init());
        if (!curl.ptr) {
            return std::unexpected(make_error_code(DownloadErrc::network_error));
        }

        TransferContext ctx;
        ctx.curl = curl.ptr;
        ctx.handler = &handler;
        ctx.stop = std::move(stop);
        HeaderList headers;

        curl_easy_setopt(curl.ptr, CURLOPT_URL, request.url.c_str());

        std::string range;
        if (request.range) {
            range = std::to_string(request.range->first) + "-" + std::to_string(request.range->second);
            curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range.c_str());
        }

        apply_common(curl.ptr, options_, headers);
        if (request.timeout.count() > 0) {
            curl_easy_setopt(curl.ptr, CURLOPT_TIMEOUT, static_cast<long>(request.timeout.count()));
        }
        curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_TIME, static_cast<long>(options_.stall_timeout.count()));
        curl_easy_setopt(curl.ptr, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);

        curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &ctx);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &ctx);
        curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);

        CURLcode result = curl_easy_perform(curl.ptr);

        // Handler-reported errors take precedence over the curl code they caused
        if (ctx.error) {
            return std::unexpected(ctx.error);
        }
        if (result != CURLE_OK) {
            spdlog::debug("GET {} [{}] failed: {}", request.url, range, curl_easy_strerror(result));
            return std::unexpected(curl_to_error(result));
        }
        if (!ctx.headers_done) {
            finish_headers(ctx);
        }
        if (auto ec = status_to_error(ctx.response.status_code)) {
            return std::unexpected(ec);
        }
        return ctx.response;
    } catch (const std::exception& e) {
        spdlog::error("GET {}: {}", request.url, e.what());
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace ferry::core
