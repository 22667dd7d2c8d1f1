//
// Created by gregorian-rayne on 12/28/25.
//

#ifndef COVA_FILE_UTILS_HPP
#define COVA_FILE_UTILS_HPP

/**
 * @file file_utils.hpp
 * @brief File system utilities.
 *
 * All operations use Result<T, Error> for error handling.
 */

#include "cova/result.hpp"
#include "cova/error.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace cova::file_utils {

    namespace fs = std::filesystem;

    inline Result<std::string, Error> read_file(const fs::path& path) {
        if (std::error_code ec; !fs::exists(path, ec)) {
            return Result<std::string, Error>::failure(
                Error::not_found("File not found", path.string())
            );
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to open file", path.string())
            );
        }

        std::ostringstream oss;
        oss << file.rdbuf();

        if (file.bad()) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to read file", path.string())
            );
        }

        return Result<std::string, Error>::success(oss.str());
    }

    inline Result<std::vector<std::string>, Error> read_lines(const fs::path& path) {
        if (std::error_code ec; !fs::exists(path, ec)) {
            return Result<std::vector<std::string>, Error>::failure(
                Error::not_found("File not found", path.string())
            );
        }

        std::ifstream file(path);
        if (!file) {
            return Result<std::vector<std::string>, Error>::failure(
                Error::io_error("Failed to open file", path.string())
            );
        }

        std::vector<std::string> lines;
        std::string line;

        while (std::getline(file, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            lines.push_back(std::move(line));
        }

        if (file.bad()) {
            return Result<std::vector<std::string>, Error>::failure(
                Error::io_error("Failed to read file", path.string())
            );
        }

        return Result<std::vector<std::string>, Error>::success(std::move(lines));
    }

    /**
     * Writes a string to a file, creating parent directories as needed.
     */
    inline Result<void, Error> write_file(const fs::path& path, std::string_view content) {
        auto parent = path.parent_path();
        if (std::error_code ec; !parent.empty() && !fs::exists(parent, ec)) {
            fs::create_directories(parent, ec);
            if (ec) {
                return Result<void, Error>::failure(
                    Error::io_error("Failed to create directory", parent.string())
                );
            }
        }

        std::ofstream file(path, std::ios::binary);
        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to open file for writing", path.string())
            );
        }

        file.write(content.data(), static_cast<std::streamsize>(content.size()));

        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to write file", path.string())
            );
        }

        return Result<void, Error>::success();
    }

    /**
     * Removes @p dir if present and creates it again empty.
     */
    inline Result<void, Error> recreate_directory(const fs::path& dir) {
        std::error_code ec;
        fs::remove_all(dir, ec);
        if (ec) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to clear directory: " + ec.message(), dir.string())
            );
        }
        fs::create_directories(dir, ec);
        if (ec) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to create directory: " + ec.message(), dir.string())
            );
        }
        return Result<void, Error>::success();
    }

    /**
     * Recursively lists regular files under @p dir.
     *
     * @param dir Directory to search.
     * @param extension Extension filter (e.g. ".csproj"); empty matches all.
     * @param skip_dirs Directory names that are not descended into.
     * @return Sorted list of matching paths or an error.
     */
    inline Result<std::vector<fs::path>, Error> list_files_recursive(
        const fs::path& dir,
        const std::string_view extension,
        const std::vector<std::string>& skip_dirs = {}
    ) {
        std::error_code ec;

        if (!fs::is_directory(dir, ec)) {
            return Result<std::vector<fs::path>, Error>::failure(
                Error::not_found("Directory not found", dir.string())
            );
        }

        std::vector<fs::path> result;
        fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
        const fs::recursive_directory_iterator end;

        for (; !ec && it != end; it.increment(ec)) {
            const auto& entry = *it;
            if (entry.is_directory(ec)) {
                const auto name = entry.path().filename().string();
                if (std::ranges::find(skip_dirs, name) != skip_dirs.end()) {
                    it.disable_recursion_pending();
                }
                continue;
            }
            if (entry.is_regular_file(ec) &&
                (extension.empty() || entry.path().extension() == extension)) {
                result.push_back(entry.path());
            }
        }

        if (ec) {
            return Result<std::vector<fs::path>, Error>::failure(
                Error::io_error("Failed to list directory: " + ec.message(), dir.string())
            );
        }

        std::ranges::sort(result);
        return Result<std::vector<fs::path>, Error>::success(std::move(result));
    }

}  // namespace cova::file_utils

#endif //COVA_FILE_UTILS_HPP
