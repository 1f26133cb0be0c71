#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace SQLChat {

enum class Role { System, User, Assistant };

std::string roleToString(Role role);
// Throws std::invalid_argument for anything other than system/user/assistant
Role roleFromString(const std::string& value);

struct Message {
    Role role = Role::User;
    std::string content;

    bool operator==(const Message& other) const { return role == other.role && content == other.content; }
    bool operator!=(const Message& other) const { return !(*this == other); }
};

using Transcript = std::vector<Message>;

// [{"role": ..., "content": ...}, ...] as sent to the backend and stored in the session log
nlohmann::json transcriptToJSON(const Transcript& transcript);
Transcript transcriptFromJSON(const nlohmann::json& doc);

struct TokenUsage {
    int64_t promptTokens = 0;
    int64_t completionTokens = 0;
    int64_t totalTokens = 0;

    TokenUsage& operator+=(const TokenUsage& other){
        promptTokens += other.promptTokens;
        completionTokens += other.completionTokens;
        totalTokens += other.totalTokens;
        return *this;
    }

    nlohmann::json toJSON() const;
};

// One successful backend round-trip
struct CompletionResponse {
    std::string content;
    std::string model;
    TokenUsage usage;
};

enum class TurnStatus { Ok, Error };

// Result record for one user turn. Built by ChatController::submitTurn and not modified afterwards.
struct TurnResult {
    std::string sessionId;
    std::string provider;
    TurnStatus status = TurnStatus::Error;
    std::string model;
    int64_t latencyMs = 0;
    std::optional<TokenUsage> tokenUsage;
    std::optional<std::string> sql;
    std::optional<std::string> answer;
    // Any other top-level keys the model put in its first reply
    nlohmann::json extraFields = nlohmann::json::object();

    bool ok() const { return status == TurnStatus::Ok; }
    nlohmann::json toJSON() const;
};

} // namespace SQLChat
