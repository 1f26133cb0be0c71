#pragma once
#include <memory>
#include <string>
#include "ChatConfig.hpp"
#include "ChatTypes.hpp"
#include "CompletionClient.hpp"
#include "DBBackend.hpp"
#include "TranscriptStore.hpp"

namespace SQLChat {

// Drives one chat session against one database: the model first proposes SQL, the statement is
// run, and the model is asked again to explain the rows. Not thread-safe; one turn at a time.
class ChatController {
public:
    static constexpr double kTemperature = 1.0;

    // Reads the task template, captures the schema of `target` and starts a new persisted
    // session. Throws if the template cannot be read or expanded or the schema cannot be read.
    // A null `client` means the OpenAI backend built from `config`.
    ChatController(ChatConfig config, DBConnectionInfo target, std::unique_ptr<ICompletionClient> client = nullptr);

    ChatController(const ChatController&) = delete;
    ChatController& operator=(const ChatController&) = delete;

    // Runs one question through both phases. Backend failures come back as status error;
    // a reply that is not a JSON object throws ReplyParseError.
    TurnResult submitTurn(const std::string& userText);

    // Points the controller at another database and starts a fresh session. On failure the
    // current session is left untouched and the exception propagates.
    void reconfigure(const DBConnectionInfo& target);

    const std::string& sessionId() const { return sessionId_; }
    const Transcript& transcript() const { return transcript_; }
    const std::string& schema() const { return schema_; }
    const DBConnectionInfo& databaseTarget() const { return target_; }
    const std::string& provider() const { return config_.provider; }
    const std::string& model() const { return config_.model; }
    TranscriptStore& store() { return store_; }

private:
    void startSession(const std::string& systemPrompt);
    void append(Role role, const std::string& content);
    void persist();

    ChatConfig config_;
    DBConnectionInfo target_;
    std::unique_ptr<ICompletionClient> client_;
    TranscriptStore store_;
    std::string templateText_;
    std::string schema_;
    std::string sessionId_;
    Transcript transcript_;
};

} // namespace SQLChat
