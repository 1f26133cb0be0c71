#pragma once
#include <stdexcept>
#include <utility>
#include <string>
#include <nlohmann/json.hpp>

namespace SQLChat {

// The model's reply could not be read as a JSON object
class ReplyParseError : public std::runtime_error {
public:
    ReplyParseError(const std::string& what, std::string content)
        : std::runtime_error(what), content_(std::move(content)) {}
    const std::string& content() const { return content_; }
private:
    std::string content_;
};

namespace ReplyParser {
    // Removes every ``` marker, together with a `json` tag directly after it
    std::string stripCodeFences(const std::string& content);

    // Strips fences and parses the rest as a JSON object. Throws ReplyParseError otherwise.
    nlohmann::json parse(const std::string& content);
}

} // namespace SQLChat
