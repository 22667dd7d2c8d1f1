//
// Created by gregorian-rayne on 1/10/26.
//

#include "cova/workspace/workspace.hpp"
#include "cova/utils/file_utils.hpp"
#include "cova/utils/path_utils.hpp"
#include "cova/utils/string_utils.hpp"
#include "cova/xml/xml_document.hpp"

#include <redlog.hpp>

#include <algorithm>
#include <regex>

namespace cova::workspace {

    namespace {

        redlog::logger log_ = redlog::get_logger("cova.workspace");

        const std::vector<std::string> kSkippedDirs = {"bin", "obj", ".git", ".vs", "TestResults", ".cova", "node_modules"};

        std::optional<bool> parse_bool(const std::string& text) {
            const auto value = string_utils::to_lower(string_utils::trim(text));
            if (value == "true") return true;
            if (value == "false") return false;
            return std::nullopt;
        }

        void add_source_globs(ProjectInfo& project) {
            const auto dir = project.directory();
            if (dir.empty()) {
                return;
            }
            auto files = file_utils::list_files_recursive(dir, ".cs", kSkippedDirs);
            if (files.is_err()) {
                log_.dbg("no source files listed", redlog::field("project", project.name),
                         redlog::field("error", files.error().message()));
                return;
            }
            for (auto& file : files.value()) {
                project.source_files.push_back(std::move(file));
            }
        }

    }  // namespace

    const ProjectInfo* Workspace::find_project(const std::string& name) const {
        const auto it = std::ranges::find_if(projects, [&name](const ProjectInfo& p) {
            return string_utils::iequals(p.name, name);
        });
        return it == projects.end() ? nullptr : &*it;
    }

    Result<std::vector<fs::path>, Error> WorkspaceLoader::parse_solution(const fs::path& solution_path) {
        const auto lines = file_utils::read_lines(solution_path);
        if (lines.is_err()) {
            return Result<std::vector<fs::path>, Error>::failure(lines.error());
        }

        const std::regex project_regex(R"lit(Project\("\{[^}]+\}"\)\s*=\s*"([^"]+)",\s*"([^"]+)")lit");
        const auto base = solution_path.parent_path();

        std::vector<fs::path> manifests;
        for (const auto& line : lines.value()) {
            if (std::smatch match; std::regex_search(line, match, project_regex)) {
                const std::string relative = path_utils::to_forward_slashes(match[2].str());
                if (!string_utils::ends_with(string_utils::to_lower(relative), ".csproj")) {
                    continue;
                }
                manifests.push_back(path_utils::normalize(base / relative));
            }
        }

        std::ranges::sort(manifests);
        return Result<std::vector<fs::path>, Error>::success(std::move(manifests));
    }

    ProjectInfo WorkspaceLoader::parse_project_manifest(const std::string& content, const fs::path& manifest_path) {
        ProjectInfo project;
        project.name = manifest_path.stem().string();
        project.path = manifest_path;

        auto doc = xml::XmlDocument::parse(content, manifest_path.string());
        if (doc.is_err()) {
            project.load_error = doc.error().to_string();
            return project;
        }

        const auto root = doc.value().root();
        if (root.name() != "Project") {
            project.load_error = "Root element is <" + root.name() + ">, expected <Project>";
            return project;
        }

        if (const auto assembly = root.descendants("AssemblyName"); !assembly.empty()) {
            const auto text = std::string(string_utils::trim(assembly.front().text()));
            if (!text.empty() && !string_utils::contains(text, "$(")) {
                project.name = text;
            }
        }

        for (const auto& ref : root.descendants("PackageReference")) {
            PackageReference package;
            package.name = ref.attribute("Include").value_or(ref.attribute("Update").value_or(""));
            if (package.name.empty()) {
                continue;
            }
            package.version = ref.attribute("Version").value_or("");
            if (package.version.empty()) {
                if (const auto version = ref.first_child("Version")) {
                    package.version = std::string(string_utils::trim(version->text()));
                }
            }
            project.packages.push_back(std::move(package));
        }

        for (const auto& ref : root.descendants("ProjectReference")) {
            if (auto include = ref.attribute("Include")) {
                project.project_references.push_back(path_utils::to_forward_slashes(*include));
            }
        }

        for (const auto& flag : root.descendants("IsTestProject")) {
            if (auto value = parse_bool(flag.text())) {
                project.is_test_project = value;
            }
        }

        for (const auto& item : root.descendants("Compile")) {
            if (auto include = item.attribute("Include"); include && !string_utils::contains(*include, "*")) {
                project.source_files.push_back(
                    path_utils::normalize(project.directory() / path_utils::to_forward_slashes(*include)));
            }
        }

        // SDK-style projects compile every .cs under their directory.
        if (root.attribute("Sdk").has_value()) {
            add_source_globs(project);
        }

        std::ranges::sort(project.source_files);
        const auto dup = std::ranges::unique(project.source_files);
        project.source_files.erase(dup.begin(), dup.end());

        return project;
    }

    ProjectInfo WorkspaceLoader::read_project(const fs::path& manifest_path) {
        const auto content = file_utils::read_file(manifest_path);
        if (content.is_err()) {
            ProjectInfo project;
            project.name = manifest_path.stem().string();
            project.path = manifest_path;
            project.load_error = content.error().to_string();
            log_.wrn("project manifest unreadable", redlog::field("path", manifest_path.string()),
                     redlog::field("error", content.error().message()));
            return project;
        }

        auto project = parse_project_manifest(content.value(), manifest_path);
        if (!project.is_loaded()) {
            log_.wrn("project manifest malformed", redlog::field("path", manifest_path.string()),
                     redlog::field("error", *project.load_error));
        } else {
            log_.dbg("project loaded", redlog::field("name", project.name),
                     redlog::field("packages", project.packages.size()),
                     redlog::field("files", project.source_files.size()));
        }
        return project;
    }

    Result<Workspace, Error> WorkspaceLoader::load(const fs::path& path) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            return Result<Workspace, Error>::failure(Error::not_found("Workspace path not found", path.string()));
        }

        Workspace ws;
        std::vector<fs::path> manifests;

        const auto absolute = fs::absolute(path, ec);
        const auto& target = ec ? path : absolute;
        const auto extension = string_utils::to_lower(target.extension().string());

        if (fs::is_directory(target, ec)) {
            ws.root = target;
            auto found = file_utils::list_files_recursive(target, ".csproj", kSkippedDirs);
            if (found.is_err()) {
                return Result<Workspace, Error>::failure(found.error());
            }
            manifests = std::move(found).value();
        } else if (extension == ".sln") {
            ws.root = target.parent_path();
            ws.solution = target;
            auto parsed = parse_solution(target);
            if (parsed.is_err()) {
                return Result<Workspace, Error>::failure(parsed.error());
            }
            manifests = std::move(parsed).value();
        } else if (extension == ".csproj") {
            ws.root = target.parent_path();
            manifests.push_back(target);
        } else {
            return Result<Workspace, Error>::failure(
                Error::invalid_argument("Expected a .sln, .csproj or directory: " + path.string()));
        }

        for (const auto& manifest : manifests) {
            ws.projects.push_back(read_project(manifest));
        }

        log_.inf("workspace loaded", redlog::field("root", ws.root.string()),
                 redlog::field("projects", ws.projects.size()));

        return Result<Workspace, Error>::success(std::move(ws));
    }

}  // namespace cova::workspace
