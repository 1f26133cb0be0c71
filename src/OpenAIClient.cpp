#include "OpenAIClient.hpp"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace SQLChat {

namespace {

struct CurlEasyDeleter { void operator()(CURL* c) const { curl_easy_cleanup(c); } };
struct CurlListDeleter { void operator()(curl_slist* l) const { curl_slist_free_all(l); } };
using CurlHandle = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlHeaders = std::unique_ptr<curl_slist, CurlListDeleter>;

size_t appendBody(void* contents, size_t size, size_t nmemb, void* userp){
    size_t n = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), n);
    return n;
}

// On allocation failure the list is left as it was
bool addHeader(CurlHeaders& headers, const std::string& line){
    curl_slist* grown = curl_slist_append(headers.get(), line.c_str());
    if(!grown) return false;
    headers.release();
    headers.reset(grown);
    return true;
}

} // namespace

std::string OpenAIClient::Response::errorMessage() const {
    if(!curlError.empty()) return curlError;
    auto j = bodyJson();
    if(j.is_object() && j.contains("error") && j["error"].is_object() && j["error"].contains("message") && j["error"]["message"].is_string())
        return j["error"]["message"].get<std::string>();
    return "HTTP " + std::to_string(httpCode);
}

OpenAIClient::OpenAIClient(const std::string& apiKey) : apiKey_(apiKey){
    static std::once_flag curlInitialized;
    std::call_once(curlInitialized, [](){ curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string OpenAIClient::buildUrl(const std::string& path) const {
    std::string base = baseUrl_;
    while(!base.empty() && base.back() == '/') base.pop_back();
    if(path.empty()) return base;
    return path.front() == '/' ? base + path : base + "/" + path;
}

OpenAIClient::Response OpenAIClient::postJson(const std::string& path, const std::string& jsonBody, const std::vector<std::string>& extraHeaders){
    Response resp;
    CurlHandle curl(curl_easy_init());
    if(!curl){ resp.curlError = "curl_easy_init failed"; return resp; }

    char errbuf[CURL_ERROR_SIZE] = {0};
    const std::string url = buildUrl(path);
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, jsonBody.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(jsonBody.size()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, appendBody);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeoutSeconds_);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, timeoutSeconds_ > 1 ? timeoutSeconds_ / 2 : 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "sqlchat/0.1");

    CurlHeaders headers;
    bool headersOk = addHeader(headers, "Content-Type: application/json") &&
                     addHeader(headers, "Accept: application/json");
    if(headersOk && !apiKey_.empty()) headersOk = addHeader(headers, "Authorization: Bearer " + apiKey_);
    for(const auto& h : extraHeaders){
        if(!headersOk) break;
        headersOk = addHeader(headers, h);
    }
    if(!headersOk){ resp.curlError = "curl_slist_append failed"; return resp; }
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());

    CURLcode res = curl_easy_perform(curl.get());
    if(res != CURLE_OK) resp.curlError = errbuf[0] ? errbuf : curl_easy_strerror(res);
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &resp.httpCode);
    return resp;
}

OpenAIClient::Response OpenAIClient::chatCompletions(const nlohmann::json& body){
    // invalid UTF-8 in a message goes out as U+FFFD instead of aborting the request
    return postJson("/chat/completions", body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

} // namespace SQLChat
