#pragma once
#include <string>
#include <memory>
#include <thread>
#include <filesystem>
#include "core/ConfigManager.h"
#include "lsp/BackendProcess.h"
#include "lsp/LspSession.h"
#include "transport/BackendWriter.h"

/**
 * @brief One running backend plus the session that talks to it.
 *
 * start() spawns the process, starts the stdout reader and stderr drain
 * threads and runs the capability handshake. shutdown() is best-effort
 * graceful, then always kills the process and clears session state.
 */
class LspBridge {
public:
    LspBridge(const Config& config, const std::filesystem::path& workspaceRoot);
    ~LspBridge();

    LspBridge(const LspBridge&) = delete;
    LspBridge& operator=(const LspBridge&) = delete;

    /** @throws BackendStartError, or the handshake's error */
    void start();
    void shutdown();

    bool isRunning() const { return process.running(); }
    const std::filesystem::path& workspaceRoot() const { return rootPath; }

    /** @throws std::logic_error before start() */
    LspSession& session();

    /**
     * @brief Read a workspace-relative file and sync it to the backend.
     * @return the document's file:// URI
     * @throws std::runtime_error if the file cannot be read
     */
    std::string openDocument(const std::string& filePath);

private:
    const Config& config;
    std::filesystem::path rootPath;

    BackendProcess process;
    std::unique_ptr<FramedFdWriter> writer;
    std::unique_ptr<LspSession> lspSession;
    std::thread readerThread;
    std::thread stderrThread;

    void readerLoop(int fd);
    void stderrLoop(int fd);
    void stopThreads();
};
