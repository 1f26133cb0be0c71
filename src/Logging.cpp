#include "Logging.hpp"
#include "stringUtils.hpp"
#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <memory>

namespace SQLChat {

void initLogging(const std::string& level, const std::string& logFile){
    plog::Severity severity = plog::severityFromString(toLower(level).c_str());
    bool unknownLevel = severity == plog::none && toLower(level) != "none";
    if(unknownLevel) severity = plog::info;

    static plog::ConsoleAppender<plog::TxtFormatter> consoleAppender(plog::streamStdErr);
    plog::Logger<PLOG_DEFAULT_INSTANCE_ID>& logger = plog::init(severity, &consoleAppender);

    if(!logFile.empty()){
        // 1 MB per file, three files kept
        static std::unique_ptr<plog::RollingFileAppender<plog::TxtFormatter>> fileAppender;
        fileAppender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(logFile.c_str(), 1000000, 3);
        logger.addAppender(fileAppender.get());
    }

    if(unknownLevel) PLOGW << "unknown log level '" << level << "', using info";
    PLOGD << "plog initialized (" << plog::severityToString(severity) << " -> stderr"
          << (logFile.empty() ? "" : ", " + logFile) << ")";
}

} // namespace SQLChat
