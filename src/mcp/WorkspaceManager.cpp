#include "mcp/WorkspaceManager.h"
#include "utils/FileUri.h"
#include "utils/Logger.h"
#include <stdexcept>

namespace fs = std::filesystem;

WorkspaceManager::WorkspaceManager(const Config& config, const fs::path& root)
    : config(config), rootPath(FileUri::canonicalize(root)) {}

WorkspaceManager::~WorkspaceManager() {
    shutdown();
}

LspBridge& WorkspaceManager::ensureStarted() {
    if (bridge && bridge->isRunning()) return *bridge;

    auto candidate = std::make_unique<LspBridge>(config, rootPath);
    candidate->start();
    bridge = std::move(candidate);
    return *bridge;
}

void WorkspaceManager::setWorkspace(const fs::path& newRoot) {
    std::error_code ec;
    fs::path resolved = FileUri::canonicalize(newRoot);
    if (!fs::is_directory(resolved, ec)) {
        throw std::invalid_argument("Workspace path is not a directory: " + newRoot.string());
    }

    shutdown();
    rootPath = resolved;
    Logger::getInstance().info("Workspace set to " + rootPath.string());
}

void WorkspaceManager::shutdown() {
    if (bridge) {
        bridge->shutdown();
        bridge.reset();
    }
}
