#include "utils/FileUtils.hpp"
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace FileUtils {

std::string getProjectRoot() {
    const fs::path currentDir = fs::current_path();
    std::vector<fs::path> candidates = { currentDir };

    fs::path current = currentDir;
    for (int i = 0; i < 5; i++) {
        if (!current.has_parent_path() || current.parent_path() == current) {
            break;
        }
        current = current.parent_path();
        candidates.push_back(current);
    }

    for (const auto& root : candidates) {
        if (fs::exists(root / "data") &&
            fs::exists(root / "include") &&
            fs::exists(root / "src")) {
            return fs::absolute(root).lexically_normal().string();
        }
    }

    return fs::absolute(currentDir).lexically_normal().string();
}

std::string joinPaths(const std::string& path1, const std::string& path2) {
    if (path2.empty()) {
        return path1;
    }
    std::string rel = path2;
    if (rel[0] == '/') {
        rel = rel.substr(1);
    }
    fs::path p = fs::path(path1) / fs::path(rel);
    return p.lexically_normal().string();
}

std::string getDataPath(const std::string& filename) {
    const std::string dataDir = joinPaths(getProjectRoot(), "data");
    return filename.empty() ? dataDir : joinPaths(dataDir, filename);
}

} // namespace FileUtils
