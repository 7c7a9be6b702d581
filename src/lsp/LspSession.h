#pragma once
#include <string>
#include <atomic>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "core/ConfigManager.h"
#include "lsp/RequestCorrelator.h"
#include "lsp/DocumentSyncTracker.h"
#include "lsp/DiagnosticsStore.h"
#include "transport/BackendWriter.h"

/**
 * @brief Protocol state for one backend connection.
 *
 * Holds everything scoped to a single bridge instance: the request table,
 * open documents, pushed diagnostics and the negotiated capabilities. All
 * traffic goes out through the writer it was given; everything the backend
 * sends comes in through handleBackendMessage().
 */
class LspSession {
public:
    LspSession(IBackendWriter& writer, const Config& config, std::filesystem::path workspaceRoot);

    /** Capability handshake. Failure of the initialize round trip propagates. */
    void initialize();

    /** shutdown request + exit notification, only if initialized; errors are ignored. */
    void gracefulShutdown();

    /** Drop documents and diagnostics and reset the session flags. */
    void resetState();

    /** Reader-thread entry: responses, pushed diagnostics, backend requests. */
    void handleBackendMessage(const nlohmann::json& message);

    /**
     * @brief Bring the backend's copy of `uri` up to date with `content`.
     *
     * On Open/Change: stored diagnostics for the uri are dropped, didOpen or
     * didChange (full text) and didSave are sent, then the call sleeps for the
     * configured delay. NoOp sends nothing.
     */
    SyncOutcome syncDocument(const std::string& uri, const std::string& content);

    nlohmann::json hover(const std::string& uri, int line, int character);
    nlohmann::json definition(const std::string& uri, int line, int character);
    nlohmann::json references(const std::string& uri, int line, int character);
    nlohmann::json completion(const std::string& uri, int line, int character);
    nlohmann::json documentSymbols(const std::string& uri);
    nlohmann::json formatting(const std::string& uri);
    nlohmann::json codeActions(const std::string& uri, int startLine, int startChar, int endLine, int endChar);

    /** Pushed diagnostics if present, else a pull request. Never throws; [] when nothing is known. */
    nlohmann::json diagnostics(const std::string& uri);

    /** { uri: [...] } from workspace pull, push cache, or a one-off discovery sweep. */
    nlohmann::json workspaceDiagnostics();

    bool isInitialized() const { return initialized; }
    bool supportsWorkspaceDiagnostics() const { return workspaceDiagnosticsSupported; }
    const std::filesystem::path& workspaceRoot() const { return rootPath; }

    RequestCorrelator& correlator() { return requests; }
    DocumentSyncTracker& documents() { return documentTracker; }
    DiagnosticsStore& diagnosticsStore() { return diagnosticStore; }

private:
    IBackendWriter& writer;
    const Config& config;
    std::filesystem::path rootPath;

    RequestCorrelator requests;
    DocumentSyncTracker documentTracker;
    DiagnosticsStore diagnosticStore;

    std::atomic<bool> initialized{false};
    std::atomic<bool> workspaceDiagnosticsSupported{false};

    nlohmann::json request(const std::string& method, const nlohmann::json& params);
    nlohmann::json positionRequest(const std::string& method, const std::string& uri, int line, int character);
    nlohmann::json initializeParams() const;
    void answerBackendRequest(const nlohmann::json& message);
    nlohmann::json workspaceDiagnosticsFallback();
};
