#include "ToolRegistry.h"
#include "utils/Logger.h"

void ToolRegistry::registerTool(std::unique_ptr<ITool> tool) {
    if (!tool) return;

    std::string name = tool->getName();
    if (tools.count(name)) {
        Logger::getInstance().warn("Replacing tool: " + name);
    } else {
        order.push_back(name);
    }

    tools[name] = std::move(tool);
}

ITool* ToolRegistry::getTool(const std::string& name) {
    auto it = tools.find(name);
    if (it == tools.end()) {
        return nullptr;
    }
    return it->second.get();
}

nlohmann::json ToolRegistry::listToolSchemas() const {
    nlohmann::json schemas = nlohmann::json::array();

    for (const auto& name : order) {
        const auto& tool = tools.at(name);
        nlohmann::json schema;
        schema["name"] = tool->getName();
        schema["description"] = tool->getDescription();
        schema["inputSchema"] = tool->getSchema();
        schemas.push_back(schema);
    }

    return schemas;
}

nlohmann::json ToolRegistry::executeTool(const std::string& name, const nlohmann::json& args) {
    ITool* tool = getTool(name);
    if (!tool) {
        nlohmann::json error;
        error["error"] = "Tool not found: " + name;
        return error;
    }

    try {
        return tool->execute(args);
    } catch (const std::exception& e) {
        Logger::getInstance().error("Tool call error (" + name + "): " + e.what());
        nlohmann::json error;
        error["error"] = e.what();
        return error;
    }
}

bool ToolRegistry::hasTool(const std::string& name) const {
    return tools.count(name) > 0;
}
