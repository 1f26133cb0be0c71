#include "ChatController.hpp"
#include "CryptoHelpers.hpp"
#include "QueryExecutor.hpp"
#include "ReplyParser.hpp"
#include "stringUtils.hpp"
#include <plog/Log.h>
#include <chrono>
#include <thread>

namespace SQLChat {

namespace {

int64_t elapsedMs(std::chrono::steady_clock::time_point since){
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - since).count();
}

// null and "" count as missing; non-string values are passed on as their JSON text
std::optional<std::string> fieldText(const nlohmann::json& fields, const char* key){
    if(!fields.contains(key) || fields[key].is_null()) return std::nullopt;
    const auto& v = fields[key];
    std::string text = v.is_string() ? v.get<std::string>() : v.dump();
    if(text.empty()) return std::nullopt;
    return text;
}

std::string buildSystemPrompt(const std::string& templateText, const std::string& schema){
    return substituteTemplate(templateText, {{"db_schema", schema}});
}

} // namespace

ChatController::ChatController(ChatConfig config, DBConnectionInfo target, std::unique_ptr<ICompletionClient> client)
    : config_(std::move(config)), target_(std::move(target)), client_(std::move(client)), store_(config_.messageLogsPath){
    templateText_ = config_.loadTemplateText();
    schema_ = QueryExecutor::extractSchema(target_);
    std::string systemPrompt = buildSystemPrompt(templateText_, schema_);

    if(!client_){
        if(config_.apiKey.empty()) PLOGW << "no API key configured; set OPENAI_API_KEY or api_key";
        client_ = std::make_unique<OpenAICompletionClient>(config_.apiKey, config_.baseUrl, config_.requestTimeoutSeconds);
    }

    std::string err;
    if(!store_.ensureSchema(&err)) PLOGW << "message log unavailable (" << store_.path() << "): " << err;

    startSession(systemPrompt);
}

void ChatController::reconfigure(const DBConnectionInfo& target){
    std::string schema = QueryExecutor::extractSchema(target);
    std::string systemPrompt = buildSystemPrompt(templateText_, schema);
    target_ = target;
    schema_ = std::move(schema);
    startSession(systemPrompt);
}

void ChatController::startSession(const std::string& systemPrompt){
    sessionId_ = "session_" + CryptoHelpers::generateTokenUrlSafe(32);
    transcript_.clear();
    transcript_.push_back({Role::System, systemPrompt});

    std::string err;
    if(!store_.createSession(sessionId_, &err)) PLOGW << "could not record session " << sessionId_ << ": " << err;
    persist();
    PLOGI << "started " << sessionId_ << " on " << target_.path();
}

void ChatController::append(Role role, const std::string& content){
    transcript_.push_back({role, content});
}

void ChatController::persist(){
    std::string err;
    if(!store_.updateSession(sessionId_, transcript_, &err))
        PLOGW << "could not persist " << sessionId_ << ": " << err;
}

TurnResult ChatController::submitTurn(const std::string& userText){
    TurnResult result;
    result.sessionId = sessionId_;
    result.provider = config_.provider;
    result.model = config_.model;

    append(Role::User, userText);
    persist();

    auto start = std::chrono::steady_clock::now();
    auto first = client_->complete(transcript_, config_.model, kTemperature);
    int64_t firstMs = elapsedMs(start);
    result.latencyMs = firstMs;
    if(!first){
        PLOGW << "[" << sessionId_ << "] no response from " << config_.provider;
        result.status = TurnStatus::Error;
        return result;
    }

    append(Role::Assistant, first->content);
    persist();
    nlohmann::json fields = ReplyParser::parse(first->content);

    result.status = TurnStatus::Ok;
    result.model = first->model;
    result.tokenUsage = first->usage;
    for(auto it = fields.begin(); it != fields.end(); ++it){
        if(it.key() == "SQL" || it.key() == "Answer") continue;
        result.extraFields[it.key()] = it.value();
    }
    result.answer = fieldText(fields, "Answer");

    if(!fields.contains("SQL")){
        result.sql = "N/A";
        return result;
    }
    // null or "" still takes the second phase; the empty statement fails and the output is empty
    const auto& sqlField = fields["SQL"];
    const std::string sql = sqlField.is_null() ? std::string() : sqlField.is_string() ? sqlField.get<std::string>() : sqlField.dump();
    result.sql = sql;

    std::this_thread::sleep_for(std::chrono::milliseconds(config_.interCallDelayMs));

    QueryResult rows = QueryExecutor::execute(target_, sql);
    std::string output = rows.ok ? rows.renderRows() : std::string();
    PLOGD << "[" << sessionId_ << "] " << (rows.ok ? "query ok" : "query failed: " + rows.error);
    append(Role::User, "SQL Query:\n" + sql + "\n\nOutput:\n" + output);
    persist();

    start = std::chrono::steady_clock::now();
    auto second = client_->complete(transcript_, config_.model, kTemperature);
    int64_t secondMs = elapsedMs(start);
    if(!second){
        PLOGW << "[" << sessionId_ << "] no response from " << config_.provider << " for the query output";
        result.status = TurnStatus::Error;
        return result;
    }

    append(Role::Assistant, second->content);
    persist();
    nlohmann::json answerFields = ReplyParser::parse(second->content);

    if(auto answer = fieldText(answerFields, "Answer")) result.answer = answer;
    *result.tokenUsage += second->usage;
    result.model = second->model;
    result.latencyMs = firstMs + config_.interCallDelayMs + secondMs;
    return result;
}

} // namespace SQLChat
