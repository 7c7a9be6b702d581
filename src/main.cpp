#include <iostream>
#include <string>
#include <cstdlib>
#include <csignal>
#include <filesystem>
#include "core/ConfigManager.h"
#include "mcp/McpServer.h"
#include "utils/Logger.h"

namespace fs = std::filesystem;

void printUsage() {
    std::cerr << "Usage: ra-mcp [workspace_path] [config_path]" << std::endl;
    std::cerr << "  workspace_path  Rust workspace root (default: current directory)" << std::endl;
    std::cerr << "  config_path     JSON config (default: <workspace>/ra-mcp.json if present)" << std::endl;
    std::cerr << "Environment: RA_MCP_LOG=debug|info|warning|error overrides log.level" << std::endl;
}

int main(int argc, char* argv[]) {
    if (argc >= 2) {
        std::string first = argv[1];
        if (first == "-h" || first == "--help") {
            printUsage();
            return 0;
        }
    }

    std::string path = ".";
    std::string configPath;

    if (argc >= 2) {
        path = argv[1];
    }
    if (argc >= 3) {
        configPath = argv[2];
    }

    fs::path workspace = fs::u8path(path);
    std::error_code ec;
    if (!fs::is_directory(workspace, ec)) {
        std::cerr << "Workspace is not a directory: " << path << std::endl;
        return 2;
    }

    if (configPath.empty()) {
        fs::path candidate = workspace / "ra-mcp.json";
        if (fs::exists(candidate, ec)) configPath = candidate.string();
    }

    Config cfg;
    if (!configPath.empty()) {
        try {
            cfg = Config::load(configPath);
        } catch (const std::exception& e) {
            std::cerr << "Failed to load config: " << e.what() << std::endl;
            return 1;
        }
    }

    auto& log = Logger::getInstance();
    std::string levelName = cfg.log.level;
    if (const char* envLevel = std::getenv("RA_MCP_LOG")) {
        levelName = envLevel;
    }
    LogLevel level;
    if (Logger::parseLevel(levelName, level)) {
        log.setLevel(level);
    } else {
        log.warn("Unknown log level '" + levelName + "', using info");
    }
    if (!cfg.log.file.empty()) {
        log.setLogFile(cfg.log.file);
    }
    if (!configPath.empty()) {
        log.info("Loaded configuration from: " + configPath);
    }

    std::signal(SIGPIPE, SIG_IGN);
    McpServer::installSignalHandlers();

    McpServer server(cfg, workspace);
    return server.run();
}
