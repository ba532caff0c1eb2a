#include "reply/http_backend.hpp"

#include <curl/curl.h>
#include <format>

using json = nlohmann::json;

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* stop = static_cast<std::stop_token*>(userdata);
    return stop->stop_requested() ? 1 : 0;
}

std::string trim(const std::string& text) {
    auto start = text.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return {};
    auto end = text.find_last_not_of(" \t\n\r");
    return text.substr(start, end - start + 1);
}

} // namespace

HttpBackend::HttpBackend(std::string url, std::string endpoint, std::string api_key,
                         std::chrono::milliseconds timeout, std::chrono::milliseconds connect_timeout)
    : url_(std::move(url)), endpoint_(std::move(endpoint)), api_key_(std::move(api_key)),
      timeout_(timeout), connect_timeout_(connect_timeout) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

HttpBackend::~HttpBackend() {
    curl_global_cleanup();
}

json HttpBackend::build_body(const ReplyRequest& request) {
    return {
        {"text", request.context.joined_text("\n")},
        {"mode", std::string(hotkey_kind_name(request.kind))},
        {"app", request.context.target.process_name},
    };
}

std::expected<std::string, Failure> HttpBackend::parse_response(long http_status, const std::string& body) {
    try {
        auto j = json::parse(body);

        if (j.contains("error")) {
            auto& err = j["error"];
            std::string msg = err.is_string() ? err.get<std::string>() : err.dump();
            return std::unexpected(Failure{ErrorKind::AiFailure, "backend error: " + msg});
        }
        if (http_status >= 400) {
            return std::unexpected(Failure{ErrorKind::AiFailure, std::format("backend returned HTTP {}", http_status)});
        }
        if (!j.contains("reply") || !j["reply"].is_string()) {
            return std::unexpected(Failure{ErrorKind::AiFailure, "unexpected response: " + body});
        }

        auto reply = trim(j["reply"].get<std::string>());
        if (reply.empty()) {
            return std::unexpected(Failure{ErrorKind::AiFailure, "backend returned an empty reply"});
        }
        return reply;
    } catch (const json::exception& e) {
        if (http_status >= 400) {
            return std::unexpected(Failure{ErrorKind::AiFailure, std::format("backend returned HTTP {}", http_status)});
        }
        return std::unexpected(Failure{ErrorKind::AiFailure, std::string("JSON parse error: ") + e.what()});
    }
}

std::expected<std::string, Failure>
HttpBackend::generate(const ReplyRequest& request, std::stop_token stop) {
    if (request.context.fragments.empty()) {
        return std::unexpected(Failure{ErrorKind::AiFailure, "empty conversation context"});
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(Failure{ErrorKind::AiFailure, "curl_easy_init failed"});
    }

    std::string endpoint = url_ + endpoint_;
    std::string payload = build_body(request).dump();
    std::string response_body;

    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "Accept: application/json");
    if (!api_key_.empty()) {
        std::string auth = "Authorization: Bearer " + api_key_;
        headers = curl_slist_append(headers, auth.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &stop);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout_.count()));

    CURLcode res = curl_easy_perform(curl);

    long http_status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        return std::unexpected(Failure{ErrorKind::Cancelled, "reply request cancelled"});
    }
    if (res == CURLE_OPERATION_TIMEDOUT) {
        return std::unexpected(Failure{ErrorKind::AiFailure,
                                       std::format("backend timed out after {} ms", timeout_.count())});
    }
    if (res != CURLE_OK) {
        return std::unexpected(Failure{ErrorKind::AiFailure, std::string("curl error: ") + curl_easy_strerror(res)});
    }

    return parse_response(http_status, response_body);
}
