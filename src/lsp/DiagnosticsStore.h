#pragma once
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <optional>
#include <filesystem>
#include <nlohmann/json.hpp>

/**
 * @brief Per-URI diagnostics as last reported by the backend.
 *
 * Each stored list replaces the previous one for its URI. Entries are kept
 * in URI order so snapshots are deterministic.
 */
class DiagnosticsStore {
public:
    /** Non-array input is stored as an empty list. */
    void store(const std::string& uri, const nlohmann::json& diagnostics);
    std::optional<nlohmann::json> get(const std::string& uri) const;
    void remove(const std::string& uri);
    void clear();
    bool empty() const;

    /** Copy of the table as a JSON object: { uri: [diagnostic, ...] }. */
    nlohmann::json snapshot() const;

    /**
     * @brief Bring a workspace/diagnostic result into the { uri: [...] } shape.
     *
     * Accepts { "items": [ { "uri", "items" | "diagnostics" } ] } or an
     * object whose values are all arrays. Anything else yields std::nullopt.
     */
    static std::optional<nlohmann::json> normalizeWorkspaceReport(const nlohmann::json& response);

    /**
     * @brief Diagnostics whose line span overlaps [startLine, endLine], both ends inclusive.
     *
     * Entries without a well-formed range are dropped.
     */
    static nlohmann::json filterByLineRange(const nlohmann::json& diagnostics, int startLine, int endLine);

    /**
     * @brief Depth-first, name-sorted walk for source files.
     * @param maxFiles stop once this many files are collected
     * @param skippedDirs directory names never entered
     * @param extensions accepted file extensions, e.g. ".rs"
     */
    static std::vector<std::filesystem::path> collectWorkspaceFiles(
        const std::filesystem::path& root, size_t maxFiles,
        const std::vector<std::string>& skippedDirs,
        const std::vector<std::string>& extensions);

private:
    mutable std::mutex mtx;
    std::map<std::string, nlohmann::json> entries;
};
