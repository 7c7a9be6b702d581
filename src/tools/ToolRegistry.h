#pragma once
#include <string>
#include <memory>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "ITool.h"

/**
 * @brief Tool registry
 *
 * Owns every registered tool and is the only way the server reaches them.
 */
class ToolRegistry {
public:
    ToolRegistry() = default;
    ~ToolRegistry() = default;

    /**
     * @brief Register a tool, replacing any tool with the same name
     * @param tool tool instance (ownership moves to the registry)
     */
    void registerTool(std::unique_ptr<ITool> tool);

    /**
     * @brief Look up a tool
     * @return tool pointer, or nullptr if no such tool exists
     */
    ITool* getTool(const std::string& name);

    /**
     * @brief Tool definitions in registration order, as tools/list returns them
     *
     * [
     *   {
     *     "name": "tool_name",
     *     "description": "...",
     *     "inputSchema": { JSON Schema }
     *   }
     * ]
     */
    nlohmann::json listToolSchemas() const;

    /**
     * @brief Execute a tool
     *
     * Unknown tools and tool failures come back as:
     * {"error": "..."}
     */
    nlohmann::json executeTool(const std::string& name, const nlohmann::json& args);

    size_t getToolCount() const { return tools.size(); }

    bool hasTool(const std::string& name) const;

private:
    std::unordered_map<std::string, std::unique_ptr<ITool>> tools;
    std::vector<std::string> order;
};
