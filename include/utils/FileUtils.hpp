#ifndef FILE_UTILS_HPP
#define FILE_UTILS_HPP

#include <string>

/**
 * @namespace FileUtils
 * @brief Contains utilities for locating project files.
 */
namespace FileUtils {
    /**
     * @brief Locates and returns the project root directory.
     * @details Searches the current directory and up to five parents for one holding
     *          data, include and src directories. Falls back to the current directory.
     * @return Path to the project root directory as a string
     */
    std::string getProjectRoot();

    /**
     * @brief Joins two path segments using the proper path separator.
     * @param path1 [in] First path segment
     * @param path2 [in] Second path segment; a leading '/' is treated as relative
     * @return Combined path as a string
     */
    std::string joinPaths(const std::string& path1, const std::string& path2);

    /**
     * @brief Path to a file in the project's data directory.
     * @param filename [in] File name inside data/ (empty for the directory itself)
     * @return Full path as a string
     */
    std::string getDataPath(const std::string& filename = "");
}

#endif // FILE_UTILS_HPP
