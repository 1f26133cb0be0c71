#include "ReplyParser.hpp"
#include <plog/Log.h>
#include <algorithm>

namespace SQLChat {
namespace ReplyParser {

std::string stripCodeFences(const std::string& content){
    static const std::string fence = "```";
    static const std::string tag = "json";
    std::string out;
    out.reserve(content.size());
    size_t pos = 0;
    while(pos < content.size()){
        size_t hit = content.find(fence, pos);
        if(hit == std::string::npos){
            out.append(content, pos, std::string::npos);
            break;
        }
        out.append(content, pos, hit - pos);
        pos = hit + fence.size();
        if(content.compare(pos, tag.size(), tag) == 0) pos += tag.size();
    }
    return out;
}

nlohmann::json parse(const std::string& content){
    const std::string stripped = stripCodeFences(content);
    nlohmann::json doc = nlohmann::json::parse(stripped, nullptr, false);
    if(doc.is_discarded() || !doc.is_object()){
        std::string ct = content.substr(0, std::min<size_t>(content.size(), 1000));
        PLOGE << "[reply] model reply is not a JSON object: " << ct << (content.size() > 1000 ? "...(truncated)" : "");
        throw ReplyParseError(doc.is_discarded() ? "model reply is not valid JSON" : "model reply is not a JSON object", content);
    }
    return doc;
}

} // namespace ReplyParser
} // namespace SQLChat
