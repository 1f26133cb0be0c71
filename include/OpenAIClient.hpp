#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace SQLChat {

// Blocking HTTP transport for OpenAI-compatible endpoints (libcurl easy interface,
// one handle per request). Knows nothing about chat semantics.
class OpenAIClient {
public:
    struct Response {
        long httpCode = 0;
        std::string body;
        std::string curlError; // empty when the transfer itself succeeded
        bool ok() const { return curlError.empty() && (httpCode >= 200 && httpCode < 300); }
        // discarded json value when the body is not valid JSON
        nlohmann::json bodyJson() const { return nlohmann::json::parse(body, nullptr, false); }
        // Best description of a failed call: curl error, then the API's error.message, then the status
        std::string errorMessage() const;
    };

    explicit OpenAIClient(const std::string& apiKey = std::string());

    void setBaseUrl(const std::string& url) { baseUrl_ = url; }
    // Whole-request limit; connecting gets at most half of it
    void setTimeoutSeconds(long seconds) { timeoutSeconds_ = seconds; }

    // POSTs `jsonBody` to baseUrl + path with JSON content headers and Bearer auth
    Response postJson(const std::string& path, const std::string& jsonBody, const std::vector<std::string>& extraHeaders = {});

    Response chatCompletions(const nlohmann::json& body);

    std::string buildUrl(const std::string& path) const;

private:
    std::string apiKey_;
    std::string baseUrl_ = "https://api.openai.com/v1";
    long timeoutSeconds_ = 30;
};

} // namespace SQLChat
