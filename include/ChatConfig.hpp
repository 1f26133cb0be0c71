#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace SQLChat {

// Settings for one chat controller. Every key is optional in the JSON file.
struct ChatConfig {
    std::string provider = "openai";
    std::string model = "gpt-4o-mini";
    std::string apiKey; // falls back to OPENAI_API_KEY
    std::string baseUrl = "https://api.openai.com/v1";
    std::string taskTemplatePath = "llm_task_template.md";
    // Template text; when empty the controller reads taskTemplatePath
    std::string taskTemplate;
    long interCallDelayMs = 1000;
    long requestTimeoutSeconds = 30;
    std::string messageLogsPath = "message_logs.db";
    std::string logLevel = "info";
    std::string logFile;

    // Overlays the keys present in `doc` onto this config. Throws nlohmann::json::exception
    // when a key has the wrong type.
    void applyJSON(const nlohmann::json& doc);

    // Defaults, then the file if it exists, then the environment credential if none was given.
    // Throws std::runtime_error if the file exists but is not a JSON object.
    static ChatConfig loadFromFile(const std::string& path);

    // Returns taskTemplate, reading it from taskTemplatePath first if needed.
    // Throws std::runtime_error if the file cannot be read.
    std::string loadTemplateText() const;
};

} // namespace SQLChat
