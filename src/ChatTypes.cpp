#include "ChatTypes.hpp"
#include <stdexcept>

namespace SQLChat {

std::string roleToString(Role role){
    switch(role){
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "user";
}

Role roleFromString(const std::string& value){
    if(value == "system") return Role::System;
    if(value == "user") return Role::User;
    if(value == "assistant") return Role::Assistant;
    throw std::invalid_argument("unknown message role: " + value);
}

nlohmann::json transcriptToJSON(const Transcript& transcript){
    nlohmann::json out = nlohmann::json::array();
    for(const auto& m : transcript){
        out.push_back({{"role", roleToString(m.role)}, {"content", m.content}});
    }
    return out;
}

Transcript transcriptFromJSON(const nlohmann::json& doc){
    if(!doc.is_array()) throw std::invalid_argument("transcript must be a JSON array");
    Transcript out;
    out.reserve(doc.size());
    for(const auto& item : doc){
        if(!item.is_object() || !item.contains("role") || !item.contains("content"))
            throw std::invalid_argument("transcript entry needs role and content");
        Message m;
        m.role = roleFromString(item.at("role").get<std::string>());
        m.content = item.at("content").get<std::string>();
        out.push_back(std::move(m));
    }
    return out;
}

nlohmann::json TokenUsage::toJSON() const {
    return {
        {"prompt_tokens", promptTokens},
        {"completion_tokens", completionTokens},
        {"total_tokens", totalTokens}
    };
}

nlohmann::json TurnResult::toJSON() const {
    nlohmann::json j = extraFields.is_object() ? extraFields : nlohmann::json::object();
    j["session_id"] = sessionId;
    j["provider"] = provider;
    j["status"] = ok() ? "ok" : "error";
    j["model"] = model;
    j["latency_ms"] = latencyMs;
    if(tokenUsage) j["token_usage"] = tokenUsage->toJSON();
    if(sql) j["SQL"] = *sql;
    if(answer) j["Answer"] = *answer;
    return j;
}

} // namespace SQLChat
