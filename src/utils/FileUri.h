#pragma once
#include <string>
#include <filesystem>

namespace FileUri {

/** Absolute, symlink-free form of `path`; falls back to an absolute path if it does not exist. */
std::filesystem::path canonicalize(const std::filesystem::path& path);

/** "file://" + canonical absolute path. */
std::string fromPath(const std::filesystem::path& path);

}  // namespace FileUri
