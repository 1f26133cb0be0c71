#pragma once
#include <algorithm>
#include <cctype>
#include <map>
#include <stdexcept>
#include <string>

namespace SQLChat {

inline std::string trim(const std::string &str)
{
    size_t s = 0;
    size_t e = str.size();
    while (s < e && std::isspace(static_cast<unsigned char>(str[s])))
        ++s;
    while (e > s && std::isspace(static_cast<unsigned char>(str[e - 1])))
        --e;
    return str.substr(s, e - s);
}

inline std::string toLower(std::string str)
{
    std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

inline bool startsWith(const std::string &str, const std::string &prefix)
{
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

// Expands `$name` and `${name}` placeholders from `values`; `$$` yields a literal `$`.
// Throws std::invalid_argument for an unknown name or a `$` that does not start a placeholder.
inline std::string substituteTemplate(const std::string &text, const std::map<std::string, std::string> &values)
{
    auto isIdentStart = [](char c) { return std::isalpha(static_cast<unsigned char>(c)) || c == '_'; };
    auto isIdentChar = [](char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; };

    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size())
    {
        char c = text[i];
        if (c != '$')
        {
            out.push_back(c);
            ++i;
            continue;
        }

        if (i + 1 < text.size() && text[i + 1] == '$')
        {
            out.push_back('$');
            i += 2;
            continue;
        }

        std::string name;
        size_t next = i + 1;
        if (next < text.size() && text[next] == '{')
        {
            size_t close = text.find('}', next + 1);
            if (close != std::string::npos)
            {
                name = text.substr(next + 1, close - next - 1);
                next = close + 1;
            }
            bool valid = !name.empty() && isIdentStart(name[0]) && std::all_of(name.begin(), name.end(), isIdentChar);
            if (!valid)
                throw std::invalid_argument("invalid placeholder in template at offset " + std::to_string(i));
        }
        else
        {
            if (next >= text.size() || !isIdentStart(text[next]))
                throw std::invalid_argument("invalid placeholder in template at offset " + std::to_string(i));
            size_t end = next;
            while (end < text.size() && isIdentChar(text[end]))
                ++end;
            name = text.substr(next, end - next);
            next = end;
        }

        auto it = values.find(name);
        if (it == values.end())
            throw std::invalid_argument("no value for template placeholder '" + name + "'");
        out += it->second;
        i = next;
    }
    return out;
}

} // namespace SQLChat
