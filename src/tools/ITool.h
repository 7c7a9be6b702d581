#pragma once
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Tool interface
 *
 * One tool per MCP-invocable operation. A tool validates its own arguments,
 * forwards to the backend and shapes the reply; it holds no protocol state.
 */
class ITool {
public:
    virtual ~ITool() = default;

    /**
     * @brief Unique tool name as listed by tools/list
     */
    virtual std::string getName() const = 0;

    /**
     * @brief Short description shown to the caller
     */
    virtual std::string getDescription() const = 0;

    /**
     * @brief JSON Schema of the arguments object
     */
    virtual nlohmann::json getSchema() const = 0;

    /**
     * @brief Run the tool
     * @param args arguments object from tools/call
     * @return MCP tool result:
     * {
     *   "content": [
     *     {"type": "text", "text": "..."}
     *   ]
     * }
     * @throws std::invalid_argument on missing or mistyped arguments; any
     *         other std::exception on failure
     */
    virtual nlohmann::json execute(const nlohmann::json& args) = 0;
};
