#include "ChatTypes.hpp"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

using namespace SQLChat;

TEST_CASE("transcript JSON keeps order and roles", "[types]")
{
    const Transcript transcript{
        {Role::System, "You answer questions."},
        {Role::User, "How many users are there?"},
        {Role::Assistant, "{\"SQL\": \"SELECT COUNT(*) FROM users;\"}"},
    };
    const auto doc = transcriptToJSON(transcript);
    REQUIRE(doc.is_array());
    REQUIRE(doc.size() == 3U);
    CHECK(doc[0]["role"] == "system");
    CHECK(doc[2]["role"] == "assistant");
    CHECK(doc[1]["content"] == "How many users are there?");
    CHECK(transcriptFromJSON(doc) == transcript);
}

TEST_CASE("transcriptFromJSON rejects bad shapes", "[types]")
{
    CHECK_THROWS_AS(transcriptFromJSON(nlohmann::json::object()), std::invalid_argument);
    CHECK_THROWS_AS(transcriptFromJSON(nlohmann::json::parse(R"([{"role": "user"}])")), std::invalid_argument);
    CHECK_THROWS_AS(transcriptFromJSON(nlohmann::json::parse(R"([{"role": "tool", "content": "x"}])")),
                    std::invalid_argument);
}

TEST_CASE("token usage adds per field", "[types]")
{
    TokenUsage total{100, 20, 120};
    total += TokenUsage{150, 30, 180};
    CHECK(total.promptTokens == 250);
    CHECK(total.completionTokens == 50);
    CHECK(total.totalTokens == 300);
    CHECK(total.toJSON() == nlohmann::json{{"prompt_tokens", 250}, {"completion_tokens", 50}, {"total_tokens", 300}});
}

TEST_CASE("TurnResult JSON omits fields that were never set", "[types]")
{
    TurnResult failed;
    failed.sessionId = "session_abc";
    failed.provider = "openai";
    failed.model = "gpt-4o-mini";
    failed.latencyMs = 12;
    const auto j = failed.toJSON();
    CHECK(j["status"] == "error");
    CHECK(j["session_id"] == "session_abc");
    CHECK(j["latency_ms"] == 12);
    CHECK_FALSE(j.contains("token_usage"));
    CHECK_FALSE(j.contains("SQL"));
    CHECK_FALSE(j.contains("Answer"));

    TurnResult done = failed;
    done.status = TurnStatus::Ok;
    done.tokenUsage = TokenUsage{1, 2, 3};
    done.sql = "N/A";
    done.answer = "Hello.";
    done.extraFields["confidence"] = "high";
    const auto k = done.toJSON();
    CHECK(k["status"] == "ok");
    CHECK(k["SQL"] == "N/A");
    CHECK(k["Answer"] == "Hello.");
    CHECK(k["confidence"] == "high");
    CHECK(k["token_usage"]["total_tokens"] == 3);
}
