#include <gtest/gtest.h>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

#include "tools/ToolRegistry.h"
#include "tools/AnalyzerTools.h"
#include "mcp/WorkspaceManager.h"

namespace fs = std::filesystem;
using nlohmann::json;

namespace {
class EchoTool : public ITool {
public:
  explicit EchoTool(std::string name) : name(std::move(name)) {}
  std::string getName() const override { return name; }
  std::string getDescription() const override { return "echo " + name; }
  json getSchema() const override { return {{"type", "object"}}; }
  json execute(const json& args) override {
    if (args.contains("fail")) throw std::runtime_error("asked to fail");
    return {{"content", json::array({{{"type", "text"}, {"text", args.dump()}}})}};
  }

private:
  std::string name;
};
}  // namespace

TEST(ToolRegistry, ListsInRegistrationOrder) {
  ToolRegistry registry;
  registry.registerTool(std::make_unique<EchoTool>("zeta"));
  registry.registerTool(std::make_unique<EchoTool>("alpha"));
  registry.registerTool(std::make_unique<EchoTool>("mid"));

  json tools = registry.listToolSchemas();
  ASSERT_EQ(tools.size(), 3u);
  EXPECT_EQ(tools[0]["name"], "zeta");
  EXPECT_EQ(tools[1]["name"], "alpha");
  EXPECT_EQ(tools[2]["name"], "mid");
  EXPECT_EQ(tools[0]["description"], "echo zeta");
  EXPECT_TRUE(tools[0].contains("inputSchema"));
}

TEST(ToolRegistry, ReplacingKeepsOriginalPosition) {
  ToolRegistry registry;
  registry.registerTool(std::make_unique<EchoTool>("a"));
  registry.registerTool(std::make_unique<EchoTool>("b"));
  registry.registerTool(std::make_unique<EchoTool>("a"));
  EXPECT_EQ(registry.getToolCount(), 2u);
  EXPECT_EQ(registry.listToolSchemas()[0]["name"], "a");
}

TEST(ToolRegistry, FailuresBecomeErrorObjects) {
  ToolRegistry registry;
  registry.registerTool(std::make_unique<EchoTool>("echo"));

  json missing = registry.executeTool("nope", json::object());
  EXPECT_EQ(missing["error"], "Tool not found: nope");

  json failed = registry.executeTool("echo", {{"fail", true}});
  EXPECT_EQ(failed["error"], "asked to fail");

  json ok = registry.executeTool("echo", {{"x", 1}});
  EXPECT_FALSE(ok.contains("error"));
  EXPECT_EQ(ok["content"][0]["text"], R"({"x":1})");
}

TEST(AnalyzerTools, CatalogIsComplete) {
  Config cfg;
  WorkspaceManager workspace(cfg, fs::temp_directory_path());
  ToolRegistry registry;
  registerAnalyzerTools(registry, workspace);

  const char* expected[] = {
    "rust_analyzer_hover", "rust_analyzer_definition", "rust_analyzer_references",
    "rust_analyzer_completion", "rust_analyzer_symbols", "rust_analyzer_format",
    "rust_analyzer_code_actions", "rust_analyzer_set_workspace",
    "rust_analyzer_diagnostics", "rust_analyzer_workspace_diagnostics"
  };
  json tools = registry.listToolSchemas();
  ASSERT_EQ(tools.size(), sizeof(expected) / sizeof(expected[0]));
  for (size_t i = 0; i < tools.size(); ++i) {
    EXPECT_EQ(tools[i]["name"], expected[i]);
    EXPECT_EQ(tools[i]["inputSchema"]["type"], "object");
  }
  EXPECT_EQ(tools[0]["inputSchema"]["required"], json({"file_path", "line", "character"}));
}

TEST(AnalyzerTools, ArgumentsAreValidatedBeforeBackendStarts) {
  Config cfg;
  cfg.backend.command = "ramcp-definitely-not-installed";
  WorkspaceManager workspace(cfg, fs::temp_directory_path());
  ToolRegistry registry;
  registerAnalyzerTools(registry, workspace);

  json r = registry.executeTool("rust_analyzer_hover", {{"file_path", "src/main.rs"}, {"line", 1}});
  EXPECT_NE(r["error"].get<std::string>().find("'character'"), std::string::npos);

  r = registry.executeTool("rust_analyzer_hover", {{"file_path", "src/main.rs"}, {"line", -1}, {"character", 0}});
  EXPECT_NE(r["error"].get<std::string>().find("'line'"), std::string::npos);

  r = registry.executeTool("rust_analyzer_symbols", {{"file_path", 12}});
  EXPECT_NE(r["error"].get<std::string>().find("'file_path'"), std::string::npos);

  // Well-formed arguments reach the missing backend.
  r = registry.executeTool("rust_analyzer_symbols", {{"file_path", "src/main.rs"}});
  EXPECT_NE(r["error"].get<std::string>().find("Failed to find"), std::string::npos);
}

TEST(AnalyzerTools, DiagnosticsSummaryCountsSeverities) {
  json diags = json::array({
    {{"severity", 1}}, {{"severity", 1}}, {{"severity", 2}}, {{"severity", 3}}, {{"severity", 4}}, {{"message", "none"}}
  });
  json summary = DiagnosticsTool::summarize(diags);
  EXPECT_EQ(summary["errors"], 2);
  EXPECT_EQ(summary["warnings"], 1);
  EXPECT_EQ(summary["information"], 1);
  EXPECT_EQ(summary["hints"], 1);
  EXPECT_EQ(summary["total"], 6);
}

TEST(AnalyzerTools, SetWorkspaceRequiresDirectory) {
  Config cfg;
  fs::path dir = fs::temp_directory_path() / "ramcp_set_workspace_test";
  std::error_code ec;
  fs::create_directories(dir, ec);

  WorkspaceManager workspace(cfg, fs::temp_directory_path());
  ToolRegistry registry;
  registerAnalyzerTools(registry, workspace);

  json bad = registry.executeTool("rust_analyzer_set_workspace", {{"workspace_path", (dir / "nope").string()}});
  EXPECT_TRUE(bad.contains("error"));

  json ok = registry.executeTool("rust_analyzer_set_workspace", {{"workspace_path", dir.string()}});
  ASSERT_FALSE(ok.contains("error"));
  EXPECT_EQ(workspace.root(), fs::canonical(dir));
  EXPECT_NE(ok["content"][0]["text"].get<std::string>().find(fs::canonical(dir).string()), std::string::npos);

  fs::remove_all(dir, ec);
}
