#pragma once
#include <string>
#include <vector>
#include <fstream>
#include <stdexcept>
#include <filesystem>
#include <nlohmann/json.hpp>

struct Config {
    struct Backend {
        std::string command = "rust-analyzer";
        std::vector<std::string> args;
        std::string languageId = "rust";
        int requestTimeoutMs = 30000;
        int shutdownTimeoutMs = 5000;
        // Forwarded to the backend only when set in our own environment.
        std::vector<std::string> forwardEnv = {"XDG_CACHE_HOME", "CARGO_TARGET_DIR", "TMPDIR"};
    } backend;

    struct Sync {
        // Pause after didOpen/didChange + didSave so the backend can start analysis.
        int documentOpenDelayMs = 500;
    } sync;

    struct Diagnostics {
        size_t maxWorkspaceFiles = 128;
        std::vector<std::string> skippedDirs = {".git", "target", "node_modules", ".idea", ".vscode"};
        std::vector<std::string> sourceExtensions = {".rs"};
    } diagnostics;

    struct Log {
        std::string level = "info";
        std::string file;
    } log;

    static Config fromJson(const nlohmann::json& j) {
        Config cfg;
        if (!j.is_object()) {
            throw std::runtime_error("Configuration root must be a JSON object");
        }
        if (j.contains("backend")) {
            const auto& b = j.at("backend");
            cfg.backend.command = b.value("command", cfg.backend.command);
            cfg.backend.args = b.value("args", cfg.backend.args);
            cfg.backend.languageId = b.value("language_id", cfg.backend.languageId);
            cfg.backend.requestTimeoutMs = b.value("request_timeout_ms", cfg.backend.requestTimeoutMs);
            cfg.backend.shutdownTimeoutMs = b.value("shutdown_timeout_ms", cfg.backend.shutdownTimeoutMs);
            cfg.backend.forwardEnv = b.value("forward_env", cfg.backend.forwardEnv);
        }
        if (j.contains("sync")) {
            cfg.sync.documentOpenDelayMs = j.at("sync").value("document_open_delay_ms", cfg.sync.documentOpenDelayMs);
        }
        if (j.contains("diagnostics")) {
            const auto& d = j.at("diagnostics");
            cfg.diagnostics.maxWorkspaceFiles = d.value("max_workspace_files", cfg.diagnostics.maxWorkspaceFiles);
            cfg.diagnostics.skippedDirs = d.value("skipped_dirs", cfg.diagnostics.skippedDirs);
            cfg.diagnostics.sourceExtensions = d.value("source_extensions", cfg.diagnostics.sourceExtensions);
        }
        if (j.contains("log")) {
            cfg.log.level = j.at("log").value("level", cfg.log.level);
            cfg.log.file = j.at("log").value("file", cfg.log.file);
        }

        if (cfg.backend.command.empty()) {
            throw std::runtime_error("backend.command must not be empty");
        }
        if (cfg.backend.requestTimeoutMs <= 0 || cfg.backend.shutdownTimeoutMs <= 0) {
            throw std::runtime_error("backend timeouts must be positive");
        }
        if (cfg.sync.documentOpenDelayMs < 0) {
            throw std::runtime_error("sync.document_open_delay_ms must not be negative");
        }
        return cfg;
    }

    static Config load(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file: " + pathStr);
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
        }

        try {
            return fromJson(j);
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Invalid configuration in " + path.string() + ": " + e.what());
        }
    }
};
