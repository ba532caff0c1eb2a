#pragma once

#include "reply/backend.hpp"

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>

class HttpBackend : public ReplyBackend {
public:
    HttpBackend(std::string url, std::string endpoint, std::string api_key,
                std::chrono::milliseconds timeout, std::chrono::milliseconds connect_timeout);
    ~HttpBackend() override;

    HttpBackend(const HttpBackend&) = delete;
    HttpBackend& operator=(const HttpBackend&) = delete;

    std::expected<std::string, Failure>
        generate(const ReplyRequest& request, std::stop_token stop) override;

    // {"text": ..., "mode": "quick"|"deep", "app": ...}
    static nlohmann::json build_body(const ReplyRequest& request);
    // Extracts "reply"; "error" or a malformed body become AiFailure.
    static std::expected<std::string, Failure> parse_response(long http_status, const std::string& body);

private:
    std::string url_;
    std::string endpoint_;
    std::string api_key_;
    std::chrono::milliseconds timeout_;
    std::chrono::milliseconds connect_timeout_;
};
