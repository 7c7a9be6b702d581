#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <nlohmann/json.hpp>

#include "lsp/DiagnosticsStore.h"

namespace fs = std::filesystem;
using nlohmann::json;

static json diagnosticAt(int startLine, int endLine, const std::string& message) {
  return {
    {"range", {{"start", {{"line", startLine}, {"character", 0}}}, {"end", {{"line", endLine}, {"character", 1}}}}},
    {"severity", 1},
    {"message", message}
  };
}

static void touch(const fs::path& p) {
  fs::create_directories(p.parent_path());
  std::ofstream out(p);
  out << "fn f() {}\n";
}

TEST(DiagnosticsStore, StoreReplacesPerUri) {
  DiagnosticsStore store;
  store.store("file:///w/a.rs", json::array({diagnosticAt(1, 1, "first")}));
  store.store("file:///w/a.rs", json::array({diagnosticAt(2, 2, "second")}));
  auto got = store.get("file:///w/a.rs");
  ASSERT_TRUE(got.has_value());
  ASSERT_EQ(got->size(), 1u);
  EXPECT_EQ((*got)[0]["message"], "second");
}

TEST(DiagnosticsStore, EmptyListIsStoredAndDistinctFromUnknown) {
  DiagnosticsStore store;
  store.store("file:///w/clean.rs", json::array());
  store.store("file:///w/odd.rs", json::object());
  EXPECT_TRUE(store.get("file:///w/clean.rs").has_value());
  EXPECT_TRUE(store.get("file:///w/odd.rs")->is_array());
  EXPECT_FALSE(store.get("file:///w/unknown.rs").has_value());
}

TEST(DiagnosticsStore, RemoveAndClear) {
  DiagnosticsStore store;
  store.store("file:///w/a.rs", json::array());
  store.store("file:///w/b.rs", json::array());
  store.remove("file:///w/a.rs");
  EXPECT_FALSE(store.get("file:///w/a.rs").has_value());
  EXPECT_FALSE(store.empty());
  store.clear();
  EXPECT_TRUE(store.empty());
  EXPECT_TRUE(store.snapshot().empty());
}

TEST(DiagnosticsStore, SnapshotIsUriOrdered) {
  DiagnosticsStore store;
  store.store("file:///w/z.rs", json::array());
  store.store("file:///w/a.rs", json::array({diagnosticAt(0, 0, "x")}));
  json snap = store.snapshot();
  ASSERT_EQ(snap.size(), 2u);
  EXPECT_EQ(snap.begin().key(), "file:///w/a.rs");
}

TEST(DiagnosticsStore, NormalizeAcceptsBothReportShapes) {
  json items = json::array({diagnosticAt(3, 3, "e")});
  json pullShape = {{"items", json::array({{{"uri", "file:///w/a.rs"}, {"kind", "full"}, {"items", items}}})}};
  json legacyShape = {{"items", json::array({{{"uri", "file:///w/a.rs"}, {"diagnostics", items}}})}};
  json mapShape = {{"file:///w/a.rs", items}};

  auto a = DiagnosticsStore::normalizeWorkspaceReport(pullShape);
  auto b = DiagnosticsStore::normalizeWorkspaceReport(legacyShape);
  auto c = DiagnosticsStore::normalizeWorkspaceReport(mapShape);
  ASSERT_TRUE(a && b && c);
  EXPECT_EQ(*a, *b);
  EXPECT_EQ(*b, *c);
}

TEST(DiagnosticsStore, NormalizeRejectsUnknownShapes) {
  EXPECT_FALSE(DiagnosticsStore::normalizeWorkspaceReport(json()).has_value());
  EXPECT_FALSE(DiagnosticsStore::normalizeWorkspaceReport(json::array()).has_value());
  EXPECT_FALSE(DiagnosticsStore::normalizeWorkspaceReport({{"file:///w/a.rs", "oops"}}).has_value());
}

TEST(DiagnosticsStore, FilterKeepsOverlappingRangesInclusive) {
  json diags = json::array({
    diagnosticAt(0, 1, "before"),
    diagnosticAt(2, 4, "touches start"),
    diagnosticAt(5, 5, "inside"),
    diagnosticAt(6, 9, "touches end"),
    diagnosticAt(10, 12, "after"),
    {{"message", "no range"}}
  });
  json filtered = DiagnosticsStore::filterByLineRange(diags, 4, 6);
  ASSERT_EQ(filtered.size(), 3u);
  EXPECT_EQ(filtered[0]["message"], "touches start");
  EXPECT_EQ(filtered[1]["message"], "inside");
  EXPECT_EQ(filtered[2]["message"], "touches end");
}

TEST(DiagnosticsStore, CollectWorkspaceFilesSortedSkippedAndCapped) {
  fs::path root = fs::temp_directory_path() / fs::path("ramcp_collect_files_test_root");
  std::error_code ec;
  fs::remove_all(root, ec);

  touch(root / "src" / "main.rs");
  touch(root / "src" / "lib.rs");
  touch(root / "src" / "util" / "mod.rs");
  touch(root / "target" / "debug" / "build.rs");
  touch(root / ".git" / "hooks.rs");
  touch(root / "README.md");
  touch(root / "build.rs");

  std::vector<std::string> skipped = {".git", "target"};
  std::vector<std::string> exts = {".rs"};

  auto all = DiagnosticsStore::collectWorkspaceFiles(root, 100, skipped, exts);
  ASSERT_EQ(all.size(), 4u);
  EXPECT_EQ(all[0], root / "build.rs");
  EXPECT_EQ(all[1], root / "src" / "lib.rs");
  EXPECT_EQ(all[2], root / "src" / "main.rs");
  EXPECT_EQ(all[3], root / "src" / "util" / "mod.rs");

  auto capped = DiagnosticsStore::collectWorkspaceFiles(root, 2, skipped, exts);
  ASSERT_EQ(capped.size(), 2u);
  EXPECT_EQ(capped[1], root / "src" / "lib.rs");

  fs::remove_all(root, ec);
}
