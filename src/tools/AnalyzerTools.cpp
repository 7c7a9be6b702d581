#include "AnalyzerTools.h"
#include "ToolRegistry.h"
#include "lsp/LspBridge.h"
#include "lsp/LspSession.h"
#include "mcp/WorkspaceManager.h"
#include <stdexcept>

std::string AnalyzerTool::requireString(const nlohmann::json& args, const std::string& key) {
    if (!args.is_object() || !args.contains(key) || !args[key].is_string()) {
        throw std::invalid_argument("Missing or invalid '" + key + "' (expected string)");
    }
    return args[key].get<std::string>();
}

int AnalyzerTool::requireInt(const nlohmann::json& args, const std::string& key) {
    if (!args.is_object() || !args.contains(key) || !args[key].is_number_integer()) {
        throw std::invalid_argument("Missing or invalid '" + key + "' (expected integer)");
    }
    long long value = args[key].get<long long>();
    if (value < 0 || value > 0x7fffffff) {
        throw std::invalid_argument("'" + key + "' out of range: " + std::to_string(value));
    }
    return static_cast<int>(value);
}

nlohmann::json AnalyzerTool::textResult(const nlohmann::json& value) {
    std::string text = value.is_string() ? value.get<std::string>() : value.dump(2);
    return {
        {"content", nlohmann::json::array({
            {{"type", "text"}, {"text", text}}
        })}
    };
}

nlohmann::json AnalyzerTool::filePathSchema(const std::string& description) {
    return {{"type", "string"}, {"description", description}};
}

// ---- PositionTool ----

nlohmann::json PositionTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"file_path", filePathSchema("Path to the file, relative to the workspace root")},
            {"line", {{"type", "integer"}, {"description", "Zero-based line number"}}},
            {"character", {{"type", "integer"}, {"description", "Zero-based character offset"}}}
        }},
        {"required", {"file_path", "line", "character"}}
    };
}

nlohmann::json PositionTool::execute(const nlohmann::json& args) {
    std::string filePath = requireString(args, "file_path");
    int line = requireInt(args, "line");
    int character = requireInt(args, "character");

    LspBridge& bridge = workspace.ensureStarted();
    std::string uri = bridge.openDocument(filePath);
    return textResult((bridge.session().*op)(uri, line, character));
}

// ---- SymbolsTool ----

nlohmann::json SymbolsTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {{"file_path", filePathSchema("Path to the file, relative to the workspace root")}}},
        {"required", {"file_path"}}
    };
}

nlohmann::json SymbolsTool::execute(const nlohmann::json& args) {
    std::string filePath = requireString(args, "file_path");
    LspBridge& bridge = workspace.ensureStarted();
    std::string uri = bridge.openDocument(filePath);
    return textResult(bridge.session().documentSymbols(uri));
}

// ---- FormatTool ----

nlohmann::json FormatTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {{"file_path", filePathSchema("Path to the file to format")}}},
        {"required", {"file_path"}}
    };
}

nlohmann::json FormatTool::execute(const nlohmann::json& args) {
    std::string filePath = requireString(args, "file_path");
    LspBridge& bridge = workspace.ensureStarted();
    std::string uri = bridge.openDocument(filePath);
    return textResult(bridge.session().formatting(uri));
}

// ---- CodeActionsTool ----

nlohmann::json CodeActionsTool::getSchema() const {
    nlohmann::json integer = {{"type", "integer"}};
    return {
        {"type", "object"},
        {"properties", {
            {"file_path", filePathSchema("Path to the file, relative to the workspace root")},
            {"line", integer},
            {"character", integer},
            {"end_line", integer},
            {"end_character", integer}
        }},
        {"required", {"file_path", "line", "character", "end_line", "end_character"}}
    };
}

nlohmann::json CodeActionsTool::execute(const nlohmann::json& args) {
    std::string filePath = requireString(args, "file_path");
    int line = requireInt(args, "line");
    int character = requireInt(args, "character");
    int endLine = requireInt(args, "end_line");
    int endCharacter = requireInt(args, "end_character");
    if (endLine < line) {
        throw std::invalid_argument("end_line must be >= line");
    }

    LspBridge& bridge = workspace.ensureStarted();
    std::string uri = bridge.openDocument(filePath);
    return textResult(bridge.session().codeActions(uri, line, character, endLine, endCharacter));
}

// ---- DiagnosticsTool ----

nlohmann::json DiagnosticsTool::summarize(const nlohmann::json& diagnostics) {
    int errors = 0, warnings = 0, information = 0, hints = 0;
    if (diagnostics.is_array()) {
        for (const auto& d : diagnostics) {
            int severity = (d.is_object() && d.contains("severity") && d["severity"].is_number_integer())
                               ? d["severity"].get<int>() : 0;
            switch (severity) {
                case 1: ++errors; break;
                case 2: ++warnings; break;
                case 3: ++information; break;
                case 4: ++hints; break;
                default: break;
            }
        }
    }
    return {
        {"errors", errors},
        {"warnings", warnings},
        {"information", information},
        {"hints", hints},
        {"total", diagnostics.is_array() ? diagnostics.size() : 0}
    };
}

nlohmann::json DiagnosticsTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {{"file_path", filePathSchema("Path to the file to check")}}},
        {"required", {"file_path"}}
    };
}

nlohmann::json DiagnosticsTool::execute(const nlohmann::json& args) {
    std::string filePath = requireString(args, "file_path");
    LspBridge& bridge = workspace.ensureStarted();
    std::string uri = bridge.openDocument(filePath);
    nlohmann::json diagnostics = bridge.session().diagnostics(uri);
    return textResult({
        {"file", filePath},
        {"diagnostics", diagnostics},
        {"summary", summarize(diagnostics)}
    });
}

// ---- WorkspaceDiagnosticsTool ----

nlohmann::json WorkspaceDiagnosticsTool::getSchema() const {
    return {{"type", "object"}, {"properties", nlohmann::json::object()}};
}

nlohmann::json WorkspaceDiagnosticsTool::execute(const nlohmann::json&) {
    LspBridge& bridge = workspace.ensureStarted();
    nlohmann::json byUri = bridge.session().workspaceDiagnostics();

    nlohmann::json all = nlohmann::json::array();
    for (auto it = byUri.begin(); it != byUri.end(); ++it) {
        if (!it.value().is_array()) continue;
        for (const auto& d : it.value()) all.push_back(d);
    }
    nlohmann::json summary = DiagnosticsTool::summarize(all);
    summary["files"] = byUri.size();
    return textResult({
        {"diagnostics", byUri},
        {"summary", summary}
    });
}

// ---- SetWorkspaceTool ----

nlohmann::json SetWorkspaceTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"workspace_path", {{"type", "string"}, {"description", "Path to the workspace root (directory containing Cargo.toml)"}}}
        }},
        {"required", {"workspace_path"}}
    };
}

nlohmann::json SetWorkspaceTool::execute(const nlohmann::json& args) {
    std::string path = requireString(args, "workspace_path");
    workspace.setWorkspace(std::filesystem::u8path(path));
    return textResult("Workspace set to: " + workspace.root().string());
}

void registerAnalyzerTools(ToolRegistry& registry, WorkspaceManager& workspace) {
    registry.registerTool(std::make_unique<PositionTool>(
        workspace, "rust_analyzer_hover", "Get hover information for a symbol at a specific position",
        &LspSession::hover));
    registry.registerTool(std::make_unique<PositionTool>(
        workspace, "rust_analyzer_definition", "Go to the definition of a symbol at a specific position",
        &LspSession::definition));
    registry.registerTool(std::make_unique<PositionTool>(
        workspace, "rust_analyzer_references", "Find all references to a symbol at a specific position",
        &LspSession::references));
    registry.registerTool(std::make_unique<PositionTool>(
        workspace, "rust_analyzer_completion", "Get completion suggestions at a specific position",
        &LspSession::completion));
    registry.registerTool(std::make_unique<SymbolsTool>(workspace));
    registry.registerTool(std::make_unique<FormatTool>(workspace));
    registry.registerTool(std::make_unique<CodeActionsTool>(workspace));
    registry.registerTool(std::make_unique<SetWorkspaceTool>(workspace));
    registry.registerTool(std::make_unique<DiagnosticsTool>(workspace));
    registry.registerTool(std::make_unique<WorkspaceDiagnosticsTool>(workspace));
}
