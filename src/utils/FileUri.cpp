#include "utils/FileUri.h"

namespace fs = std::filesystem;

namespace FileUri {

fs::path canonicalize(const fs::path& path) {
    std::error_code ec;
    fs::path canonical = fs::canonical(path, ec);
    if (!ec) return canonical;

    fs::path absolute = fs::absolute(path, ec);
    if (ec) return path;
    return absolute.lexically_normal();
}

std::string fromPath(const fs::path& path) {
    return "file://" + canonicalize(path).generic_string();
}

}  // namespace FileUri
