#include "mcp/McpServer.h"
#include "tools/AnalyzerTools.h"
#include "transport/StdioTransport.h"
#include "core/Errors.h"
#include "utils/Logger.h"
#include <atomic>
#include <csignal>
#include <unistd.h>

namespace {
std::atomic<bool> g_stop{false};

void onSignal(int) {
    g_stop.store(true);
}

constexpr const char* kDefaultProtocolVersion = "2024-11-05";
}

McpServer::McpServer(const Config& config, const std::filesystem::path& workspaceRoot)
    : workspaceManager(config, workspaceRoot) {
    registerAnalyzerTools(tools, workspaceManager);
}

void McpServer::requestStop() { g_stop.store(true); }
bool McpServer::stopRequested() { return g_stop.load(); }
void McpServer::resetStop() { g_stop.store(false); }

void McpServer::installSignalHandlers() {
    struct sigaction sa {};
    sa.sa_handler = onSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

int McpServer::run() {
    return runWithStreams(STDIN_FILENO, STDOUT_FILENO);
}

int McpServer::runWithStreams(int inFd, int outFd) {
    auto& log = Logger::getInstance();
    StdioTransport transport(inFd, outFd);
    transport.setInterruptCheck([] { return stopRequested(); });

    log.info("MCP server ready, workspace: " + workspaceManager.root().string());

    int exitCode = 0;
    while (!stopRequested()) {
        std::optional<Frame> frame;
        try {
            frame = transport.readMessage();
        } catch (const TransportError& e) {
            log.error(std::string("Input stream error: ") + e.what());
            exitCode = 1;
            break;
        }
        if (!frame) break;

        nlohmann::json request;
        try {
            request = nlohmann::json::parse(frame->payload);
        } catch (const nlohmann::json::parse_error& e) {
            log.warn(std::string("Skipping unparseable message: ") + e.what());
            continue;
        }
        if (!request.is_object()) {
            log.warn("Skipping non-object message");
            continue;
        }

        if (!request.contains("id") || request["id"].is_null()) {
            const bool named = request.contains("method") && request["method"].is_string();
            log.debug("Notification: " + (named ? request["method"].get<std::string>() : std::string("<none>")));
            continue;
        }

        nlohmann::json response = handleRequest(request);
        try {
            transport.writeMessage(response.dump(), frame->framing);
        } catch (const TransportError& e) {
            log.error(std::string("Output stream error: ") + e.what());
            exitCode = 1;
            break;
        }
    }

    log.info("MCP server stopping");
    workspaceManager.shutdown();
    return exitCode;
}

nlohmann::json McpServer::handleRequest(const nlohmann::json& request) {
    nlohmann::json id = request.contains("id") ? request["id"] : nlohmann::json();
    std::string method = (request.contains("method") && request["method"].is_string())
                             ? request["method"].get<std::string>() : "";
    nlohmann::json params = request.contains("params") ? request["params"] : nlohmann::json();

    Logger::getInstance().debug("Request: " + method);

    if (method == "initialize") {
        return makeResult(id, handleInitialize(params));
    }
    if (method == "ping") {
        return makeResult(id, nlohmann::json::object());
    }
    if (method == "tools/list") {
        return makeResult(id, {{"tools", tools.listToolSchemas()}});
    }
    if (method == "tools/call") {
        return handleToolsCall(id, params);
    }
    return makeError(id, -32601, "Method not found: " + method);
}

nlohmann::json McpServer::handleInitialize(const nlohmann::json& params) {
    std::string protocolVersion = kDefaultProtocolVersion;
    if (params.is_object() && params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
        protocolVersion = params["protocolVersion"].get<std::string>();
    }
    return {
        {"protocolVersion", protocolVersion},
        {"serverInfo", {{"name", "ra-mcp"}, {"version", RAMCP_VERSION}}},
        {"capabilities", {{"tools", nlohmann::json::object()}}}
    };
}

nlohmann::json McpServer::handleToolsCall(const nlohmann::json& id, const nlohmann::json& params) {
    if (!params.is_object()) {
        return makeError(id, -32602, "Missing params");
    }
    if (!params.contains("name") || !params["name"].is_string()) {
        return makeError(id, -32602, "Missing tool name");
    }
    std::string name = params["name"].get<std::string>();
    if (!tools.hasTool(name)) {
        return makeError(id, -32602, "Unknown tool: " + name);
    }

    nlohmann::json args = params.contains("arguments") && params["arguments"].is_object()
                              ? params["arguments"] : nlohmann::json::object();

    nlohmann::json result = tools.executeTool(name, args);
    if (result.is_object() && result.contains("error")) {
        std::string message = result["error"].is_string() ? result["error"].get<std::string>()
                                                          : result["error"].dump();
        return makeError(id, -1, message);
    }
    return makeResult(id, result);
}

nlohmann::json McpServer::makeResult(const nlohmann::json& id, const nlohmann::json& result) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

nlohmann::json McpServer::makeError(const nlohmann::json& id, int code, const std::string& message) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}
