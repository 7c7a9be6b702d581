#include "lsp/DiagnosticsStore.h"
#include <algorithm>

namespace fs = std::filesystem;

void DiagnosticsStore::store(const std::string& uri, const nlohmann::json& diagnostics) {
    std::lock_guard<std::mutex> lock(mtx);
    entries[uri] = diagnostics.is_array() ? diagnostics : nlohmann::json::array();
}

std::optional<nlohmann::json> DiagnosticsStore::get(const std::string& uri) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = entries.find(uri);
    if (it == entries.end()) return std::nullopt;
    return it->second;
}

void DiagnosticsStore::remove(const std::string& uri) {
    std::lock_guard<std::mutex> lock(mtx);
    entries.erase(uri);
}

void DiagnosticsStore::clear() {
    std::lock_guard<std::mutex> lock(mtx);
    entries.clear();
}

bool DiagnosticsStore::empty() const {
    std::lock_guard<std::mutex> lock(mtx);
    return entries.empty();
}

nlohmann::json DiagnosticsStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx);
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [uri, items] : entries) {
        out[uri] = items;
    }
    return out;
}

std::optional<nlohmann::json> DiagnosticsStore::normalizeWorkspaceReport(const nlohmann::json& response) {
    if (!response.is_object()) return std::nullopt;

    // Pull-diagnostics report: { "items": [ { "uri": "...", "items": [...] }, ... ] }
    if (response.contains("items") && response["items"].is_array()) {
        nlohmann::json normalized = nlohmann::json::object();
        for (const auto& item : response["items"]) {
            if (!item.is_object() || !item.contains("uri") || !item["uri"].is_string()) continue;

            nlohmann::json diagnostics = nlohmann::json::array();
            if (item.contains("items")) {
                diagnostics = item["items"];
            } else if (item.contains("diagnostics")) {
                diagnostics = item["diagnostics"];
            }
            if (diagnostics.is_array()) {
                normalized[item["uri"].get<std::string>()] = diagnostics;
            }
        }
        return normalized;
    }

    // Already { "file://...": [ ... ] }
    bool allArrays = std::all_of(response.begin(), response.end(),
                                 [](const nlohmann::json& v) { return v.is_array(); });
    if (allArrays) return response;

    return std::nullopt;
}

nlohmann::json DiagnosticsStore::filterByLineRange(const nlohmann::json& diagnostics, int startLine, int endLine) {
    nlohmann::json filtered = nlohmann::json::array();
    if (!diagnostics.is_array()) return filtered;

    auto lineOf = [](const nlohmann::json& range, const char* key, long long& out) -> bool {
        if (!range.contains(key) || !range[key].is_object()) return false;
        const auto& pos = range[key];
        if (!pos.contains("line") || !pos["line"].is_number_integer()) return false;
        out = pos["line"].get<long long>();
        return true;
    };

    for (const auto& d : diagnostics) {
        if (!d.is_object() || !d.contains("range") || !d["range"].is_object()) continue;
        long long diagStart = 0;
        long long diagEnd = 0;
        if (!lineOf(d["range"], "start", diagStart) || !lineOf(d["range"], "end", diagEnd)) continue;

        if (diagStart <= endLine && diagEnd >= startLine) {
            filtered.push_back(d);
        }
    }
    return filtered;
}

namespace {
void collectRecursive(const fs::path& dir, size_t maxFiles,
                      const std::vector<std::string>& skippedDirs,
                      const std::vector<std::string>& extensions,
                      std::vector<fs::path>& files) {
    if (files.size() >= maxFiles) return;

    std::error_code ec;
    std::vector<fs::directory_entry> children;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        children.push_back(*it);
    }
    std::sort(children.begin(), children.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) { return a.path() < b.path(); });

    for (const auto& entry : children) {
        std::error_code typeEc;
        if (entry.is_symlink(typeEc)) {
            // Linked directories may loop back into the tree.
            if (fs::is_directory(entry.path(), typeEc)) continue;
        }

        if (entry.is_directory(typeEc)) {
            std::string name = entry.path().filename().string();
            if (std::find(skippedDirs.begin(), skippedDirs.end(), name) != skippedDirs.end()) continue;
            collectRecursive(entry.path(), maxFiles, skippedDirs, extensions, files);
            if (files.size() >= maxFiles) return;
            continue;
        }

        std::string ext = entry.path().extension().string();
        if (std::find(extensions.begin(), extensions.end(), ext) != extensions.end()) {
            files.push_back(entry.path());
            if (files.size() >= maxFiles) return;
        }
    }
}
}  // namespace

std::vector<fs::path> DiagnosticsStore::collectWorkspaceFiles(
    const fs::path& root, size_t maxFiles,
    const std::vector<std::string>& skippedDirs,
    const std::vector<std::string>& extensions) {
    std::vector<fs::path> files;
    collectRecursive(root, maxFiles, skippedDirs, extensions, files);
    return files;
}
