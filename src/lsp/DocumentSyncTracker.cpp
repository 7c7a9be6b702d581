#include "lsp/DocumentSyncTracker.h"

SyncOutcome DocumentSyncTracker::sync(const std::string& uri, const std::string& content) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = documents.find(uri);
    if (it == documents.end()) {
        documents.emplace(uri, OpenDocumentState{1, content});
        return {SyncOutcome::Action::Open, 1};
    }
    if (it->second.content == content) {
        return {SyncOutcome::Action::NoOp, 0};
    }
    it->second.version += 1;
    it->second.content = content;
    return {SyncOutcome::Action::Change, it->second.version};
}

std::optional<int> DocumentSyncTracker::version(const std::string& uri) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = documents.find(uri);
    if (it == documents.end()) return std::nullopt;
    return it->second.version;
}

size_t DocumentSyncTracker::size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return documents.size();
}

void DocumentSyncTracker::clear() {
    std::lock_guard<std::mutex> lock(mtx);
    documents.clear();
}
