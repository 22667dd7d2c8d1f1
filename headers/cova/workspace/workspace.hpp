//
// Created by gregorian-rayne on 1/10/26.
//

#ifndef COVA_WORKSPACE_HPP
#define COVA_WORKSPACE_HPP

/**
 * @file workspace.hpp
 * @brief Loaded solution: projects, their package references and files.
 *
 * A Workspace is read-only once loaded. Projects whose manifest could not
 * be read stay in the list with load_error set, so callers can report them
 * without the whole load failing.
 */

#include "cova/result.hpp"
#include "cova/error.hpp"
#include "cova/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cova::workspace {

    struct PackageReference {
        std::string name;
        std::string version;
    };

    struct ProjectInfo {
        std::string name;
        /// Path of the project manifest (.csproj).
        fs::path path;
        std::vector<PackageReference> packages;
        std::vector<std::string> project_references;
        /// Value of an explicit <IsTestProject> property, when present.
        std::optional<bool> is_test_project;
        std::vector<fs::path> source_files;
        std::optional<std::string> load_error;

        [[nodiscard]] fs::path directory() const {
            return path.parent_path();
        }

        [[nodiscard]] bool is_loaded() const noexcept {
            return !load_error.has_value();
        }
    };

    struct Workspace {
        fs::path root;
        /// Solution file the workspace came from; empty for directory scans.
        fs::path solution;
        std::vector<ProjectInfo> projects;

        [[nodiscard]] const ProjectInfo* find_project(const std::string& name) const;
    };

    class WorkspaceLoader {
    public:
        /**
         * Loads a workspace from a .sln file, a single .csproj, or a
         * directory scanned recursively for .csproj files.
         */
        static Result<Workspace, Error> load(const fs::path& path);

        /**
         * Lists project manifests referenced by a solution file.
         * Solution folders and non-C# projects are skipped.
         */
        static Result<std::vector<fs::path>, Error> parse_solution(const fs::path& solution_path);

        /**
         * Reads one manifest. Never fails; problems land in load_error.
         */
        static ProjectInfo read_project(const fs::path& manifest_path);

        /**
         * Parses manifest text without touching the file system beyond
         * the implicit source glob of the manifest's directory.
         */
        static ProjectInfo parse_project_manifest(const std::string& content, const fs::path& manifest_path);
    };

}  // namespace cova::workspace

#endif //COVA_WORKSPACE_HPP
