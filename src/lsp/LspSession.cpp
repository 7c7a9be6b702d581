#include "lsp/LspSession.h"
#include "utils/FileUri.h"
#include "utils/Logger.h"
#include <chrono>
#include <fstream>
#include <thread>
#include <unistd.h>

namespace {
const nlohmann::json CODE_ACTION_KINDS = {
    "quickfix", "refactor", "refactor.extract", "refactor.inline", "refactor.rewrite", "source"
};

nlohmann::json textDocument(const std::string& uri) {
    return {{"uri", uri}};
}
}  // namespace

LspSession::LspSession(IBackendWriter& writer, const Config& config, std::filesystem::path workspaceRoot)
    : writer(writer), config(config), rootPath(std::move(workspaceRoot)), requests(writer) {}

nlohmann::json LspSession::request(const std::string& method, const nlohmann::json& params) {
    return requests.sendRequest(method, params, std::chrono::milliseconds(config.backend.requestTimeoutMs));
}

nlohmann::json LspSession::initializeParams() const {
    nlohmann::json checkOnSave = {
        {"enable", true},
        {"command", "check"},
        {"allTargets", true}
    };
    return {
        {"processId", static_cast<int>(getpid())},
        {"rootUri", FileUri::fromPath(rootPath)},
        {"initializationOptions", {
            {"cargo", {{"buildScripts", {{"enable", true}}}}},
            {"checkOnSave", checkOnSave},
            {"diagnostics", {
                {"enable", true},
                {"experimental", {{"enable", true}}}
            }},
            {"procMacro", {{"enable", true}}}
        }},
        {"capabilities", {
            {"textDocument", {
                {"hover", {{"contentFormat", {"markdown", "plaintext"}}}},
                {"completion", {{"completionItem", {{"snippetSupport", true}}}}},
                {"definition", {{"linkSupport", true}}},
                {"references", nlohmann::json::object()},
                {"documentSymbol", nlohmann::json::object()},
                {"codeAction", {
                    {"codeActionLiteralSupport", {
                        {"codeActionKind", {
                            {"valueSet", {"quickfix", "refactor", "refactor.extract", "refactor.inline",
                                          "refactor.rewrite", "source", "source.organizeImports"}}
                        }}
                    }},
                    {"resolveSupport", {{"properties", {"edit"}}}}
                }},
                {"publishDiagnostics", {
                    {"relatedInformation", true},
                    {"tagSupport", {{"valueSet", {1, 2}}}}
                }},
                {"formatting", nlohmann::json::object()}
            }},
            {"workspace", {
                {"didChangeConfiguration", {{"dynamicRegistration", false}}}
            }}
        }}
    };
}

void LspSession::initialize() {
    auto& log = Logger::getInstance();
    nlohmann::json result = request("initialize", initializeParams());

    bool workspaceSupport = false;
    if (result.is_object() && result.contains("capabilities")) {
        const auto& caps = result["capabilities"];
        if (caps.is_object() && caps.contains("diagnosticProvider") && caps["diagnosticProvider"].is_object()) {
            const auto& provider = caps["diagnosticProvider"];
            workspaceSupport = provider.contains("workspaceDiagnostics") &&
                               provider["workspaceDiagnostics"].is_boolean() &&
                               provider["workspaceDiagnostics"].get<bool>();
        }
    }
    workspaceDiagnosticsSupported = workspaceSupport;
    log.info(std::string("workspace/diagnostic support: ") + (workspaceSupport ? "true" : "false"));

    requests.sendNotification("initialized", nlohmann::json::object());
    initialized = true;

    try {
        requests.sendNotification("workspace/didChangeConfiguration", {
            {"settings", {
                {"rust-analyzer", {
                    {"checkOnSave", {{"enable", true}, {"command", "check"}, {"allTargets", true}}}
                }}
            }}
        });
    } catch (const std::exception& e) {
        log.debug(std::string("didChangeConfiguration failed: ") + e.what());
    }

    // Kicks off the initial cargo check.
    try {
        request("rust-analyzer/reloadWorkspace", nullptr);
    } catch (const std::exception& e) {
        log.debug(std::string("reloadWorkspace failed: ") + e.what());
    }
}

void LspSession::gracefulShutdown() {
    if (!initialized) return;
    try {
        requests.sendRequest("shutdown", nullptr, std::chrono::milliseconds(config.backend.shutdownTimeoutMs));
    } catch (const std::exception& e) {
        Logger::getInstance().debug(std::string("shutdown request failed: ") + e.what());
    }
    try {
        requests.sendNotification("exit", nullptr);
    } catch (const std::exception& e) {
        Logger::getInstance().debug(std::string("exit notification failed: ") + e.what());
    }
}

void LspSession::resetState() {
    documentTracker.clear();
    diagnosticStore.clear();
    initialized = false;
    workspaceDiagnosticsSupported = false;
}

void LspSession::handleBackendMessage(const nlohmann::json& message) {
    if (!message.is_object()) return;
    const bool hasId = message.contains("id") && !message["id"].is_null();

    if (message.contains("method") && message["method"].is_string()) {
        if (hasId) {
            answerBackendRequest(message);
            return;
        }
        const std::string method = message["method"].get<std::string>();
        if (method == "textDocument/publishDiagnostics" && message.contains("params")) {
            const auto& params = message["params"];
            if (params.is_object() && params.contains("uri") && params["uri"].is_string()) {
                const std::string uri = params["uri"].get<std::string>();
                // Without a list there is nothing to replace the current entry with.
                if (!params.contains("diagnostics") || !params["diagnostics"].is_array()) {
                    Logger::getInstance().debug("Skipping malformed publishDiagnostics for " + uri);
                    return;
                }
                const auto& items = params["diagnostics"];
                Logger::getInstance().debug("publishDiagnostics: " + uri + " (" + std::to_string(items.size()) + ")");
                diagnosticStore.store(uri, items);
            }
        } else {
            Logger::getInstance().debug("Ignoring backend notification: " + method);
        }
        return;
    }

    if (hasId) {
        requests.resolve(message);
    }
}

void LspSession::answerBackendRequest(const nlohmann::json& message) {
    const std::string method = message["method"].get<std::string>();
    nlohmann::json result = nullptr;
    if (method == "workspace/configuration") {
        result = nlohmann::json::array();
        if (message.contains("params") && message["params"].contains("items") && message["params"]["items"].is_array()) {
            for (size_t i = 0; i < message["params"]["items"].size(); ++i) result.push_back(nullptr);
        }
    }
    nlohmann::json reply = {
        {"jsonrpc", "2.0"},
        {"id", message["id"]},
        {"result", result}
    };
    try {
        writer.writeMessage(reply);
    } catch (const std::exception& e) {
        Logger::getInstance().debug("Could not answer backend request " + method + ": " + e.what());
    }
}

SyncOutcome LspSession::syncDocument(const std::string& uri, const std::string& content) {
    auto& log = Logger::getInstance();
    SyncOutcome outcome = documentTracker.sync(uri, content);
    if (!outcome.needsNotification()) {
        log.debug("Document already open and up to date: " + uri);
        return outcome;
    }

    // Stale results must not be visible while fresh ones are pending.
    diagnosticStore.remove(uri);

    if (outcome.action == SyncOutcome::Action::Open) {
        log.info("Opening document: " + uri);
        requests.sendNotification("textDocument/didOpen", {
            {"textDocument", {
                {"uri", uri},
                {"languageId", config.backend.languageId},
                {"version", outcome.version},
                {"text", content}
            }}
        });
    } else {
        log.info("Document changed, sending didChange: " + uri);
        requests.sendNotification("textDocument/didChange", {
            {"textDocument", {{"uri", uri}, {"version", outcome.version}}},
            {"contentChanges", nlohmann::json::array({{{"text", content}}})}
        });
    }

    // didSave triggers the on-save check.
    requests.sendNotification("textDocument/didSave", {{"textDocument", textDocument(uri)}});

    if (config.sync.documentOpenDelayMs > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(config.sync.documentOpenDelayMs));
    }
    return outcome;
}

nlohmann::json LspSession::positionRequest(const std::string& method, const std::string& uri, int line, int character) {
    return request(method, {
        {"textDocument", textDocument(uri)},
        {"position", {{"line", line}, {"character", character}}}
    });
}

nlohmann::json LspSession::hover(const std::string& uri, int line, int character) {
    return positionRequest("textDocument/hover", uri, line, character);
}

nlohmann::json LspSession::definition(const std::string& uri, int line, int character) {
    return positionRequest("textDocument/definition", uri, line, character);
}

nlohmann::json LspSession::references(const std::string& uri, int line, int character) {
    return request("textDocument/references", {
        {"textDocument", textDocument(uri)},
        {"position", {{"line", line}, {"character", character}}},
        {"context", {{"includeDeclaration", true}}}
    });
}

nlohmann::json LspSession::completion(const std::string& uri, int line, int character) {
    return positionRequest("textDocument/completion", uri, line, character);
}

nlohmann::json LspSession::documentSymbols(const std::string& uri) {
    return request("textDocument/documentSymbol", {{"textDocument", textDocument(uri)}});
}

nlohmann::json LspSession::formatting(const std::string& uri) {
    return request("textDocument/formatting", {
        {"textDocument", textDocument(uri)},
        {"options", {{"tabSize", 4}, {"insertSpaces", true}}}
    });
}

nlohmann::json LspSession::diagnostics(const std::string& uri) {
    auto& log = Logger::getInstance();
    if (auto stored = diagnosticStore.get(uri)) {
        log.debug("Found " + std::to_string(stored->size()) + " stored diagnostics for " + uri);
        return *stored;
    }

    log.debug("No stored diagnostics for " + uri + ", trying pull model");
    try {
        nlohmann::json response = request("textDocument/diagnostic", {{"textDocument", textDocument(uri)}});
        if (response.is_object() && response.contains("items") && response["items"].is_array()) {
            return response["items"];
        }
    } catch (const std::exception& e) {
        log.debug(std::string("textDocument/diagnostic failed: ") + e.what());
    }
    return nlohmann::json::array();
}

nlohmann::json LspSession::workspaceDiagnostics() {
    auto& log = Logger::getInstance();
    if (workspaceDiagnosticsSupported) {
        try {
            nlohmann::json response = request("workspace/diagnostic", {
                {"identifier", "rust-analyzer"},
                {"previousResultId", nullptr}
            });
            if (auto normalized = DiagnosticsStore::normalizeWorkspaceReport(response)) {
                return *normalized;
            }
            log.info("workspace/diagnostic returned unsupported response; falling back");
        } catch (const std::exception& e) {
            log.info(std::string("workspace/diagnostic request failed; falling back: ") + e.what());
        }
    } else {
        log.info("workspace/diagnostic not supported by server; using fallback");
    }
    return workspaceDiagnosticsFallback();
}

nlohmann::json LspSession::workspaceDiagnosticsFallback() {
    nlohmann::json all = diagnosticStore.snapshot();
    if (!all.empty()) return all;

    // Nothing known yet: open workspace files so the backend publishes diagnostics.
    auto files = DiagnosticsStore::collectWorkspaceFiles(rootPath, config.diagnostics.maxWorkspaceFiles,
                                                         config.diagnostics.skippedDirs,
                                                         config.diagnostics.sourceExtensions);
    Logger::getInstance().info("Opening " + std::to_string(files.size()) + " workspace files for diagnostics");
    for (const auto& path : files) {
        std::ifstream f(path, std::ios::binary);
        if (!f.is_open()) continue;
        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        try {
            syncDocument(FileUri::fromPath(path), content);
        } catch (const std::exception& e) {
            Logger::getInstance().warn("Failed to open " + path.string() + ": " + e.what());
        }
    }
    return diagnosticStore.snapshot();
}

nlohmann::json LspSession::codeActions(const std::string& uri, int startLine, int startChar, int endLine, int endChar) {
    nlohmann::json filtered = DiagnosticsStore::filterByLineRange(diagnostics(uri), startLine, endLine);
    return request("textDocument/codeAction", {
        {"textDocument", textDocument(uri)},
        {"range", {
            {"start", {{"line", startLine}, {"character", startChar}}},
            {"end", {{"line", endLine}, {"character", endChar}}}
        }},
        {"context", {
            {"diagnostics", filtered},
            {"only", CODE_ACTION_KINDS}
        }}
    });
}
