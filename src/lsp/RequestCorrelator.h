#pragma once
#include <string>
#include <mutex>
#include <future>
#include <chrono>
#include <cstdint>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "transport/BackendWriter.h"

/**
 * @brief Matches backend responses to the callers waiting for them.
 *
 * Ids come from one counter starting at 1. Each outstanding request owns one
 * completion slot; the slot leaves the table exactly once, either when the
 * reader thread resolves it or when its waiter gives up.
 */
class RequestCorrelator {
public:
    explicit RequestCorrelator(IBackendWriter& writer) : writer(writer) {}

    /**
     * @brief Send a request and block until its response or the timeout.
     * @return the response's "result" member (may be null)
     * @throws RequestTimeoutError, BackendResponseError, TransportError
     */
    nlohmann::json sendRequest(const std::string& method, const nlohmann::json& params,
                               std::chrono::milliseconds timeout);

    void sendNotification(const std::string& method, const nlohmann::json& params);

    /**
     * @brief Reader-side entry for a response object.
     * @return true if a waiting slot was resolved; unmatched ids are dropped
     */
    bool resolve(const nlohmann::json& response);

    size_t pendingCount() const;

private:
    IBackendWriter& writer;

    std::mutex idMutex;
    int64_t nextId = 1;

    mutable std::mutex pendingMutex;
    std::unordered_map<int64_t, std::promise<nlohmann::json>> pending;

    int64_t allocateId();
    void dropSlot(int64_t id);
};
