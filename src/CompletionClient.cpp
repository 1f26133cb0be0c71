#include "CompletionClient.hpp"
#include <plog/Log.h>
#include <algorithm>

namespace SQLChat {

nlohmann::json buildChatCompletionRequest(const Transcript& transcript, const std::string& model, double temperature){
    return {
        {"model", model},
        {"messages", transcriptToJSON(transcript)},
        {"temperature", temperature}
    };
}

static bool readCount(const nlohmann::json& usage, const char* key, int64_t& out){
    if(!usage.contains(key) || !usage[key].is_number_integer()) return false;
    out = usage[key].get<int64_t>();
    return true;
}

std::optional<CompletionResponse> parseChatCompletion(const nlohmann::json& reply, std::string* outError){
    auto fail = [outError](const std::string& why) -> std::optional<CompletionResponse> {
        if(outError) *outError = why;
        return std::nullopt;
    };
    if(!reply.is_object()) return fail("reply is not a JSON object");
    if(!reply.contains("choices") || !reply["choices"].is_array() || reply["choices"].empty())
        return fail("reply has no choices");
    const auto& c = reply["choices"][0];
    if(!c.is_object() || !c.contains("message") || !c["message"].is_object() ||
       !c["message"].contains("content") || !c["message"]["content"].is_string())
        return fail("first choice has no message content");
    if(!reply.contains("usage") || !reply["usage"].is_object()) return fail("reply has no usage block");
    if(!reply.contains("model") || !reply["model"].is_string()) return fail("reply has no model name");

    CompletionResponse out;
    out.content = c["message"]["content"].get<std::string>();
    out.model = reply["model"].get<std::string>();
    const auto& usage = reply["usage"];
    if(!readCount(usage, "prompt_tokens", out.usage.promptTokens) ||
       !readCount(usage, "completion_tokens", out.usage.completionTokens) ||
       !readCount(usage, "total_tokens", out.usage.totalTokens))
        return fail("usage block is incomplete");
    return out;
}

OpenAICompletionClient::OpenAICompletionClient(const std::string& apiKey, const std::string& baseUrl, long timeoutSeconds)
    : client_(apiKey){
    client_.setBaseUrl(baseUrl);
    client_.setTimeoutSeconds(timeoutSeconds);
}

std::optional<CompletionResponse> OpenAICompletionClient::complete(const Transcript& transcript, const std::string& model, double temperature){
    nlohmann::json body = buildChatCompletionRequest(transcript, model, temperature);
    PLOGD << "[chat] POST " << client_.buildUrl("/chat/completions") << " model=" << model << " messages=" << transcript.size();

    auto r = client_.chatCompletions(body);
    if(!r.ok()){
        std::string bodyLog = r.body.substr(0, std::min<size_t>(r.body.size(), 1000));
        PLOGE << "[chat] request failed: " << r.errorMessage() << " (" << r.httpCode << ") " << bodyLog;
        return std::nullopt;
    }

    auto j = r.bodyJson();
    if(j.is_discarded()){
        PLOGE << "[chat] backend returned a body that is not JSON";
        return std::nullopt;
    }
    std::string err;
    auto parsed = parseChatCompletion(j, &err);
    if(!parsed){
        PLOGE << "[chat] unexpected reply shape: " << err;
        return std::nullopt;
    }
    PLOGD << "[chat] reply from " << parsed->model << " tokens=" << parsed->usage.totalTokens;
    return parsed;
}

} // namespace SQLChat
