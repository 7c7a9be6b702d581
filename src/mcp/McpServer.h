#pragma once
#include <string>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "core/ConfigManager.h"
#include "mcp/WorkspaceManager.h"
#include "tools/ToolRegistry.h"

#ifndef RAMCP_VERSION
#define RAMCP_VERSION "0.0.0"
#endif

/**
 * @brief MCP server over stdio
 *
 * Serves initialize, ping, tools/list and tools/call. Each reply goes out in
 * the framing its request arrived in. Messages without an id are
 * notifications and get no reply.
 */
class McpServer {
public:
    McpServer(const Config& config, const std::filesystem::path& workspaceRoot);

    /** Serve stdin/stdout until end of input or a stop request. */
    int run();
    int runWithStreams(int inFd, int outFd);

    /**
     * @brief Build the response for one request
     * @return full JSON-RPC response object (result or error)
     */
    nlohmann::json handleRequest(const nlohmann::json& request);

    ToolRegistry& registry() { return tools; }
    WorkspaceManager& workspace() { return workspaceManager; }

    static void requestStop();
    static bool stopRequested();
    static void resetStop();

    /** SIGINT/SIGTERM request a stop; installed without SA_RESTART so a blocked read returns. */
    static void installSignalHandlers();

private:
    WorkspaceManager workspaceManager;
    ToolRegistry tools;

    nlohmann::json handleInitialize(const nlohmann::json& params);
    nlohmann::json handleToolsCall(const nlohmann::json& id, const nlohmann::json& params);

    static nlohmann::json makeResult(const nlohmann::json& id, const nlohmann::json& result);
    static nlohmann::json makeError(const nlohmann::json& id, int code, const std::string& message);
};
