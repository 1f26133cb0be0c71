#pragma once
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "ChatTypes.hpp"
#include "OpenAIClient.hpp"

namespace SQLChat {

// Language-model backend. Stateless between calls: the whole transcript goes out every time.
// Any transport failure comes back as std::nullopt; retries are the caller's business.
class ICompletionClient {
public:
    virtual ~ICompletionClient() = default;
    virtual std::optional<CompletionResponse> complete(const Transcript& transcript, const std::string& model, double temperature) = 0;
};

// Extracts choices[0].message.content, usage and model from a chat-completions reply.
// Returns std::nullopt if any of them is missing or has the wrong type.
std::optional<CompletionResponse> parseChatCompletion(const nlohmann::json& reply, std::string* outError = nullptr);

nlohmann::json buildChatCompletionRequest(const Transcript& transcript, const std::string& model, double temperature);

class OpenAICompletionClient : public ICompletionClient {
public:
    OpenAICompletionClient(const std::string& apiKey, const std::string& baseUrl, long timeoutSeconds);

    std::optional<CompletionResponse> complete(const Transcript& transcript, const std::string& model, double temperature) override;

private:
    OpenAIClient client_;
};

} // namespace SQLChat
