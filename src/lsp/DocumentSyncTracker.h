#pragma once
#include <string>
#include <mutex>
#include <optional>
#include <unordered_map>

/** What the backend has to be told after a sync decision. */
struct SyncOutcome {
    enum class Action {
        NoOp,
        Open,
        Change
    };

    Action action = Action::NoOp;
    int version = 0;  // version after the sync; 0 for NoOp

    bool needsNotification() const { return action != Action::NoOp; }
};

/**
 * @brief Version/content table for documents the backend has open.
 *
 * sync() only decides and records; it performs no I/O. A version starts at 1
 * and moves up by one for each content change, together with the content.
 */
class DocumentSyncTracker {
public:
    SyncOutcome sync(const std::string& uri, const std::string& content);

    std::optional<int> version(const std::string& uri) const;
    size_t size() const;
    void clear();

private:
    struct OpenDocumentState {
        int version = 0;
        std::string content;
    };

    mutable std::mutex mtx;
    std::unordered_map<std::string, OpenDocumentState> documents;
};
