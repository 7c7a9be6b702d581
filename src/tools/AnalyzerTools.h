#pragma once
#include "ITool.h"
#include <string>
#include <utility>

class WorkspaceManager;
class LspSession;
class ToolRegistry;

/**
 * @brief Shared plumbing for tools that need the backend
 *
 * Starts the bridge on demand and syncs the target document before the
 * operation runs.
 */
class AnalyzerTool : public ITool {
public:
    explicit AnalyzerTool(WorkspaceManager& workspace) : workspace(workspace) {}

protected:
    WorkspaceManager& workspace;

    static std::string requireString(const nlohmann::json& args, const std::string& key);
    static int requireInt(const nlohmann::json& args, const std::string& key);
    static nlohmann::json textResult(const nlohmann::json& value);
    static nlohmann::json filePathSchema(const std::string& description);
};

/**
 * @brief hover / definition / references / completion at a position
 */
class PositionTool : public AnalyzerTool {
public:
    using Operation = nlohmann::json (LspSession::*)(const std::string&, int, int);

    PositionTool(WorkspaceManager& workspace, std::string name, std::string description, Operation op)
        : AnalyzerTool(workspace), name(std::move(name)), description(std::move(description)), op(op) {}

    std::string getName() const override { return name; }
    std::string getDescription() const override { return description; }
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    std::string name;
    std::string description;
    Operation op;
};

class SymbolsTool : public AnalyzerTool {
public:
    using AnalyzerTool::AnalyzerTool;

    std::string getName() const override { return "rust_analyzer_symbols"; }
    std::string getDescription() const override { return "Get document symbols (functions, structs, etc.) for a file"; }
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;
};

class FormatTool : public AnalyzerTool {
public:
    using AnalyzerTool::AnalyzerTool;

    std::string getName() const override { return "rust_analyzer_format"; }
    std::string getDescription() const override { return "Get formatting edits for a file"; }
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;
};

/**
 * @brief Code actions for a range, with the diagnostics overlapping that range attached
 */
class CodeActionsTool : public AnalyzerTool {
public:
    using AnalyzerTool::AnalyzerTool;

    std::string getName() const override { return "rust_analyzer_code_actions"; }
    std::string getDescription() const override { return "Get available code actions (quick fixes, refactors) for a range"; }
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;
};

class DiagnosticsTool : public AnalyzerTool {
public:
    using AnalyzerTool::AnalyzerTool;

    std::string getName() const override { return "rust_analyzer_diagnostics"; }
    std::string getDescription() const override { return "Get compiler diagnostics (errors, warnings, hints) for a file"; }
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

    /** { errors, warnings, information, hints, total } by LSP severity */
    static nlohmann::json summarize(const nlohmann::json& diagnostics);
};

class WorkspaceDiagnosticsTool : public AnalyzerTool {
public:
    using AnalyzerTool::AnalyzerTool;

    std::string getName() const override { return "rust_analyzer_workspace_diagnostics"; }
    std::string getDescription() const override { return "Get diagnostics for every file in the workspace"; }
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;
};

/**
 * @brief Switch the workspace root; the backend restarts on the next call
 */
class SetWorkspaceTool : public AnalyzerTool {
public:
    using AnalyzerTool::AnalyzerTool;

    std::string getName() const override { return "rust_analyzer_set_workspace"; }
    std::string getDescription() const override { return "Set the workspace root directory for rust-analyzer"; }
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;
};

void registerAnalyzerTools(ToolRegistry& registry, WorkspaceManager& workspace);
