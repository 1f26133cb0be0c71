#pragma once
#include <string>

namespace SQLChat {

// Console logging on stderr, plus a rolling file when `logFile` is set.
// Unknown level names fall back to info.
void initLogging(const std::string& level, const std::string& logFile = std::string());

} // namespace SQLChat
