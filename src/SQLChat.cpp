#include <iostream>
#include <memory>
#include <string>
#include <plog/Log.h>
#include "ChatConfig.hpp"
#include "ChatController.hpp"
#include "Logging.hpp"
#include "ReplyParser.hpp"
#include "stringUtils.hpp"

using namespace SQLChat;

static void printUsage(const char* argv0)
{
    std::cerr << "usage: " << argv0 << " <DATABASE_FILEPATH> [--config <file>]\n"
              << "commands: /session /schema /reset /db <path> /quit\n";
}

int main(int argc, char** argv)
{
    std::string dbPath;
    std::string configPath = "sqlchat.json";
    for(int i = 1; i < argc; ++i){
        std::string arg = argv[i];
        if(arg == "--config" && i + 1 < argc){
            configPath = argv[++i];
        } else if(arg == "-h" || arg == "--help"){
            printUsage(argv[0]);
            return 0;
        } else if(dbPath.empty()){
            dbPath = arg;
        } else {
            printUsage(argv[0]);
            return 2;
        }
    }
    if(dbPath.empty()){
        printUsage(argv[0]);
        return 2;
    }

    ChatConfig config;
    try{
        config = ChatConfig::loadFromFile(configPath);
    } catch(const std::exception& ex){
        initLogging("info");
        PLOGE << "Failed to load config: " << ex.what();
        return 1;
    }
    initLogging(config.logLevel, config.logFile);

    std::unique_ptr<ChatController> chat;
    try{
        chat = std::make_unique<ChatController>(config, DBConnectionInfo::fromPath(dbPath));
    } catch(const std::exception& ex){
        PLOGE << "Failed to start chat on " << dbPath << ": " << ex.what();
        return 1;
    }
    std::cout << chat->sessionId() << std::endl;

    std::string line;
    while(std::cout << "> " << std::flush, std::getline(std::cin, line)){
        std::string input = trim(line);
        if(input.empty()) continue;

        if(input == "/quit") break;
        if(input == "/session"){
            std::cout << chat->sessionId() << std::endl;
            continue;
        }
        if(input == "/schema"){
            std::cout << chat->schema() << std::endl;
            continue;
        }
        if(input == "/reset" || startsWith(input, "/db ")){
            DBConnectionInfo target = input == "/reset" ? chat->databaseTarget()
                                                         : DBConnectionInfo::fromPath(trim(input.substr(4)));
            try{
                chat->reconfigure(target);
                std::cout << chat->sessionId() << std::endl;
            } catch(const std::exception& ex){
                PLOGE << "Could not switch to " << target.path() << ": " << ex.what();
            }
            continue;
        }

        try{
            TurnResult result = chat->submitTurn(input);
            std::cout << result.toJSON().dump(4, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
        } catch(const ReplyParseError& ex){
            PLOGE << ex.what() << "; reply was: " << ex.content();
        } catch(const std::exception& ex){
            PLOGE << "Turn failed: " << ex.what();
        }
    }
    return 0;
}
