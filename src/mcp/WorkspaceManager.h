#pragma once
#include <memory>
#include <filesystem>
#include "core/ConfigManager.h"
#include "lsp/LspBridge.h"

/**
 * Current workspace root and the bridge serving it. The bridge is started
 * lazily by the first tool that needs the backend.
 */
class WorkspaceManager {
public:
    WorkspaceManager(const Config& config, const std::filesystem::path& root);
    ~WorkspaceManager();

    const std::filesystem::path& root() const { return rootPath; }

    /** @throws BackendStartError, or the handshake's error */
    LspBridge& ensureStarted();

    /** Shut the running bridge down and point at a new directory. */
    void setWorkspace(const std::filesystem::path& newRoot);

    void shutdown();

private:
    const Config& config;
    std::filesystem::path rootPath;
    std::unique_ptr<LspBridge> bridge;
};
