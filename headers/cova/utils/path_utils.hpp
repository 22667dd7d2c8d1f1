//
// Created by gregorian-rayne on 12/28/25.
//

#ifndef COVA_PATH_UTILS_HPP
#define COVA_PATH_UTILS_HPP

/**
 * @file path_utils.hpp
 * @brief Path manipulation utilities.
 */

#include <filesystem>
#include <string>

namespace cova::path_utils {

    namespace fs = std::filesystem;

    /**
     * Normalizes a path by resolving . and .. components.
     *
     * Unlike fs::canonical(), this works on paths that don't exist
     * and doesn't resolve symlinks.
     */
    inline fs::path normalize(const fs::path& path) {
        fs::path result;

        for (const auto& component : path) {
            if (component == ".") {
                continue;
            }
            if (component == "..") {
                if (!result.empty() && result.filename() != "..") {
                    result = result.parent_path();
                } else {
                    result /= component;
                }
            } else {
                result /= component;
            }
        }

        return result.empty() ? "." : result;
    }

    inline std::string to_forward_slashes(const fs::path& path) {
        std::string result = path.string();
        for (char& c : result) {
            if (c == '\\') {
                c = '/';
            }
        }
        return result;
    }

    /**
     * Canonical key for a source file named in a coverage report.
     *
     * Reports written on Windows use backslashes, so separators are
     * unified before resolving dot components.
     */
    inline std::string normalize_report_path(const std::string& path) {
        if (path.empty()) {
            return path;
        }
        return to_forward_slashes(normalize(fs::path(to_forward_slashes(path))));
    }

}  // namespace cova::path_utils

#endif //COVA_PATH_UTILS_HPP
