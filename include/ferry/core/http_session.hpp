// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/transport.hpp>
#include <chrono>
#include <map>
#include <string>

namespace ferry::core {

struct HttpOptions {
    std::chrono::seconds connect_timeout{30};
    std::chrono::seconds stall_timeout{30};     // abort below 1 B/s for this long
    std::string bearer_token;
    std::map<std::string, std::string> headers;
    std::string user_agent;
    bool verify_tls{true};
};

// libcurl-backed Transport. One easy handle per request, so a single session
// is shared by all workers.
class HttpSession final : public Transport {
public:
    HttpSession();
    explicit HttpSession(HttpOptions options);
    ~HttpSession() override;

    // Non-copyable, movable
    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;
    HttpSession(HttpSession&&) noexcept = default;
    HttpSession& operator=(HttpSession&&) noexcept = default;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const std::string& url) noexcept override;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    get(const RangeRequest& request,
        const ResponseHandler& handler,
        std::stop_token stop) noexcept override;

    [[nodiscard]] const HttpOptions& options() const noexcept { return options_; }

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    HttpOptions options_;
};

} // namespace ferry::core
