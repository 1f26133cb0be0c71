#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <plog/Log.h>
#include "Logging.hpp"
#include "QueryExecutor.hpp"

using namespace SQLChat;
namespace fs = std::filesystem;

// Rebuilds ./data/<DATA_HANDLE>/data.sqlite from a SQL script
int main(int argc, char** argv)
{
    initLogging("info");
    if(argc != 3){
        std::cerr << "usage: " << argv[0] << " <DATA_HANDLE> <SQL_SCRIPT>\n";
        return 2;
    }
    const std::string handle = argv[1];
    const std::string scriptPath = argv[2];
    if(handle.empty() || handle.find('/') != std::string::npos || handle == "." || handle == ".."){
        PLOGE << "Invalid data handle '" << handle << "'";
        return 2;
    }

    std::ifstream in(scriptPath, std::ios::binary);
    if(!in){
        PLOGE << "Cannot read SQL script " << scriptPath;
        return 1;
    }
    std::ostringstream ss;
    ss << in.rdbuf();

    fs::path dir = fs::path("data") / handle;
    fs::path dbFile = dir / "data.sqlite";
    std::error_code ec;
    fs::create_directories(dir, ec);
    if(ec){
        PLOGE << "Cannot create " << dir.string() << ": " << ec.message();
        return 1;
    }
    if(fs::exists(dbFile)){
        fs::remove(dbFile, ec);
        if(ec){
            PLOGE << "Cannot remove old " << dbFile.string() << ": " << ec.message();
            return 1;
        }
        PLOGI << "Removed existing " << dbFile.string();
    }

    DBConnectionInfo target;
    target.sqlite_dir = dir.string();
    target.sqlite_filename = "data.sqlite";
    target.createIfMissing = true;

    std::string err;
    if(!QueryExecutor::executeScript(target, ss.str(), &err)){
        std::cerr << "failed: " << err << "\n";
        return 1;
    }
    PLOGI << "Created " << target.path();
    std::cout << target.path() << std::endl;
    return 0;
}
