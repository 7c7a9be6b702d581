#include "lsp/RequestCorrelator.h"
#include "core/Errors.h"
#include "utils/Logger.h"

int64_t RequestCorrelator::allocateId() {
    std::lock_guard<std::mutex> lock(idMutex);
    return nextId++;
}

void RequestCorrelator::dropSlot(int64_t id) {
    std::lock_guard<std::mutex> lock(pendingMutex);
    pending.erase(id);
}

nlohmann::json RequestCorrelator::sendRequest(const std::string& method, const nlohmann::json& params,
                                              std::chrono::milliseconds timeout) {
    const int64_t id = allocateId();
    nlohmann::json msg = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method}
    };
    if (!params.is_null()) msg["params"] = params;

    // The slot exists before the frame leaves, so a fast reply cannot miss it.
    std::future<nlohmann::json> reply;
    {
        std::lock_guard<std::mutex> lock(pendingMutex);
        reply = pending[id].get_future();
    }

    Logger::getInstance().debug("LSP request #" + std::to_string(id) + ": " + method);
    try {
        writer.writeMessage(msg);
    } catch (...) {
        dropSlot(id);
        throw;
    }

    if (reply.wait_for(timeout) != std::future_status::ready) {
        bool removed = false;
        {
            std::lock_guard<std::mutex> lock(pendingMutex);
            removed = pending.erase(id) > 0;
        }
        // Not removed means the reader resolved it between the wait and the erase.
        if (removed) {
            Logger::getInstance().warn("LSP request timed out: " + method + " (id " + std::to_string(id) + ")");
            throw RequestTimeoutError(method, id);
        }
    }

    nlohmann::json response = reply.get();
    if (response.contains("error") && response["error"].is_object()) {
        const auto& err = response["error"];
        int code = err.contains("code") && err["code"].is_number_integer() ? err["code"].get<int>() : 0;
        std::string message = err.contains("message") && err["message"].is_string()
                                  ? err["message"].get<std::string>() : "unknown error";
        throw BackendResponseError(code, message);
    }
    if (response.contains("result")) return response["result"];
    return nullptr;
}

void RequestCorrelator::sendNotification(const std::string& method, const nlohmann::json& params) {
    nlohmann::json msg = {
        {"jsonrpc", "2.0"},
        {"method", method},
        {"params", params.is_null() ? nlohmann::json::object() : params}
    };
    Logger::getInstance().debug("LSP notification: " + method);
    writer.writeMessage(msg);
}

bool RequestCorrelator::resolve(const nlohmann::json& response) {
    if (!response.is_object() || !response.contains("id")) return false;
    const auto& idValue = response["id"];
    if (!idValue.is_number_integer()) return false;
    const int64_t id = idValue.get<int64_t>();

    std::promise<nlohmann::json> slot;
    {
        std::lock_guard<std::mutex> lock(pendingMutex);
        auto it = pending.find(id);
        if (it == pending.end()) {
            Logger::getInstance().debug("Dropping LSP response without waiter (id " + std::to_string(id) + ")");
            return false;
        }
        slot = std::move(it->second);
        pending.erase(it);
    }
    slot.set_value(response);
    return true;
}

size_t RequestCorrelator::pendingCount() const {
    std::lock_guard<std::mutex> lock(pendingMutex);
    return pending.size();
}
