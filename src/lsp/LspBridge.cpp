#include "lsp/LspBridge.h"
#include "core/Errors.h"
#include "transport/StdioTransport.h"
#include "utils/FileUri.h"
#include "utils/Logger.h"
#include <cerrno>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

namespace fs = std::filesystem;

LspBridge::LspBridge(const Config& config, const fs::path& workspaceRoot)
    : config(config), rootPath(FileUri::canonicalize(workspaceRoot)) {}

LspBridge::~LspBridge() {
    shutdown();
}

LspSession& LspBridge::session() {
    if (!lspSession) throw std::logic_error("Client not initialized");
    return *lspSession;
}

void LspBridge::start() {
    if (process.running()) return;
    auto& log = Logger::getInstance();
    log.info("Starting " + config.backend.command + " in workspace: " + rootPath.string());

    BackendProcess::Options options;
    options.command = config.backend.command;
    options.args = config.backend.args;
    options.workingDir = rootPath;
    options.forwardEnv = config.backend.forwardEnv;
    process.spawn(options);

    writer = std::make_unique<FramedFdWriter>(process.stdinFd());
    lspSession = std::make_unique<LspSession>(*writer, config, rootPath);
    // Leftovers from an earlier session must not leak into this one.
    lspSession->diagnosticsStore().clear();

    readerThread = std::thread(&LspBridge::readerLoop, this, process.stdoutFd());
    stderrThread = std::thread(&LspBridge::stderrLoop, this, process.stderrFd());

    try {
        lspSession->initialize();
    } catch (const std::exception& e) {
        log.error(std::string("Backend handshake failed: ") + e.what());
        process.terminate();
        stopThreads();
        lspSession->resetState();
        throw;
    }
    log.info(config.backend.command + " client started and initialized");
}

void LspBridge::shutdown() {
    if (!lspSession) return;
    if (process.running()) {
        lspSession->gracefulShutdown();
        process.terminate();
    }
    stopThreads();
    lspSession->resetState();
}

void LspBridge::stopThreads() {
    if (writer) writer->close();
    if (readerThread.joinable()) readerThread.join();
    if (stderrThread.joinable()) stderrThread.join();
    process.closeStreams();
}

std::string LspBridge::openDocument(const std::string& filePath) {
    fs::path absolutePath = FileUri::canonicalize(rootPath / fs::u8path(filePath));
    std::ifstream f(absolutePath, std::ios::binary);
    if (!f.is_open()) {
        throw std::runtime_error("Failed to read file " + filePath + ": cannot open " + absolutePath.string());
    }
    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (f.bad()) {
        throw std::runtime_error("Failed to read file " + filePath);
    }

    std::string uri = FileUri::fromPath(absolutePath);
    session().syncDocument(uri, content);
    return uri;
}

void LspBridge::readerLoop(int fd) {
    auto& log = Logger::getInstance();
    StdioTransport transport(fd, -1);
    try {
        while (auto frame = transport.readMessage()) {
            nlohmann::json msg;
            try {
                msg = nlohmann::json::parse(frame->payload);
            } catch (const nlohmann::json::parse_error& e) {
                log.warn(std::string("Unparseable backend message: ") + e.what());
                continue;
            }
            try {
                lspSession->handleBackendMessage(msg);
            } catch (const std::exception& e) {
                log.warn(std::string("Failed to handle backend message: ") + e.what());
            }
        }
    } catch (const TransportError& e) {
        log.error(std::string("Backend output stream failed: ") + e.what());
    }
    log.debug("Backend reader finished");
}

void LspBridge::stderrLoop(int fd) {
    auto& log = Logger::getInstance();
    std::string pending;
    char temp[4096];
    while (true) {
        ssize_t n = read(fd, temp, sizeof(temp));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        pending.append(temp, static_cast<size_t>(n));
        size_t newline;
        while ((newline = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            if (!line.empty()) log.debug("[backend] " + line);
        }
    }
    if (!pending.empty()) log.debug("[backend] " + pending);
}
