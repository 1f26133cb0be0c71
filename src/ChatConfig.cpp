#include "ChatConfig.hpp"
#include <plog/Log.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace SQLChat {

void ChatConfig::applyJSON(const nlohmann::json& doc){
    if(doc.contains("provider")) provider = doc["provider"].get<std::string>();
    if(doc.contains("model")) model = doc["model"].get<std::string>();
    if(doc.contains("api_key")) apiKey = doc["api_key"].get<std::string>();
    if(doc.contains("base_url")) baseUrl = doc["base_url"].get<std::string>();
    if(doc.contains("task_template_file")) taskTemplatePath = doc["task_template_file"].get<std::string>();
    if(doc.contains("inter_call_delay_ms")) interCallDelayMs = doc["inter_call_delay_ms"].get<long>();
    if(doc.contains("request_timeout_seconds")) requestTimeoutSeconds = doc["request_timeout_seconds"].get<long>();
    if(doc.contains("message_logs_db")) messageLogsPath = doc["message_logs_db"].get<std::string>();
    if(doc.contains("log_level")) logLevel = doc["log_level"].get<std::string>();
    if(doc.contains("log_file")) logFile = doc["log_file"].get<std::string>();
}

ChatConfig ChatConfig::loadFromFile(const std::string& path){
    ChatConfig cfg;
    if(!path.empty() && std::filesystem::exists(path)){
        std::ifstream in(path);
        if(!in) throw std::runtime_error("cannot open config file " + path);
        nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
        if(doc.is_discarded() || !doc.is_object())
            throw std::runtime_error("config file " + path + " is not a JSON object");
        cfg.applyJSON(doc);
    } else if(!path.empty()){
        PLOGD << "config file " << path << " not found, using defaults";
    }
    if(cfg.apiKey.empty()){
        const char* env = std::getenv("OPENAI_API_KEY");
        if(env) cfg.apiKey = env;
    }
    return cfg;
}

std::string ChatConfig::loadTemplateText() const {
    if(!taskTemplate.empty()) return taskTemplate;
    std::ifstream in(taskTemplatePath, std::ios::binary);
    if(!in) throw std::runtime_error("cannot read task template " + taskTemplatePath);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace SQLChat
