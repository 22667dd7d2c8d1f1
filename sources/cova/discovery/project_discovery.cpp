//
// Created by gregorian-rayne on 1/10/26.
//

#include "cova/discovery/project_discovery.hpp"
#include "cova/error.hpp"
#include "cova/utils/string_utils.hpp"

#include <redlog.hpp>

#include <algorithm>
#include <array>

namespace cova::discovery {

    namespace {

        redlog::logger log_ = redlog::get_logger("cova.discovery");

        constexpr std::array<std::string_view, 4> kFrameworkPrefixes = {"xunit", "nunit", "mstest", "tunit"};

        constexpr std::array<std::string_view, 6> kTestSegments = {
            "test", "tests", "unittests", "integrationtests", "spec", "specs"
        };

        std::vector<std::string> name_segments(const std::string& name) {
            std::vector<std::string> segments;
            std::string current;
            for (const char c : name) {
                if (c == '.' || c == '-' || c == '_') {
                    if (!current.empty()) {
                        segments.push_back(std::move(current));
                        current.clear();
                    }
                } else {
                    current.push_back(c);
                }
            }
            if (!current.empty()) {
                segments.push_back(std::move(current));
            }
            return segments;
        }

        bool name_filtered_out(const std::string& name, const CoverageAnalysisOptions& options) {
            if (string_utils::contains_ignore_case(options.excluded_projects, name) ||
                string_utils::contains_ignore_case(options.excluded_test_projects, name)) {
                return true;
            }
            return !options.included_test_projects.empty() &&
                   !string_utils::contains_ignore_case(options.included_test_projects, name);
        }

    }  // namespace

    bool is_test_framework_package(const std::string& package_name) {
        const auto lower = string_utils::to_lower(package_name);
        if (lower == "microsoft.net.test.sdk") {
            return true;
        }
        return std::ranges::any_of(kFrameworkPrefixes, [&lower](const std::string_view prefix) {
            return string_utils::starts_with(lower, prefix);
        });
    }

    bool follows_test_naming(const std::string& project_name) {
        for (const auto& segment : name_segments(project_name)) {
            const auto lower = string_utils::to_lower(segment);
            if (std::ranges::find(kTestSegments, lower) != kTestSegments.end()) {
                return true;
            }
            // PascalCase suffix: "CoreTests", "ApiTest", not "Contest".
            if (string_utils::ends_with(segment, "Tests") || string_utils::ends_with(segment, "Test")) {
                return true;
            }
        }
        return false;
    }

    Classification classify_project(const workspace::ProjectInfo& project) {
        // IsTestProject=false is often inherited from Directory.Build.props; only true settles it.
        if (project.is_test_project.value_or(false)) {
            return {true, TestSignal::ExplicitFlag, "IsTestProject=true"};
        }

        for (const auto& package : project.packages) {
            if (is_test_framework_package(package.name)) {
                return {true, TestSignal::FrameworkPackage, package.name};
            }
        }

        if (follows_test_naming(project.name)) {
            return {true, TestSignal::NamingConvention, project.name};
        }

        return {};
    }

    std::vector<fs::path> select_test_projects(
        const std::vector<workspace::ProjectInfo>& projects,
        const CoverageAnalysisOptions& options
    ) {
        std::vector<fs::path> selected;

        for (const auto& project : projects) {
            if (!project.is_loaded()) {
                const auto error = Error::discovery_error(*project.load_error, project.path.string());
                log_.wrn("skipping unreadable project", redlog::field("project", project.name),
                         redlog::field("error", error.to_string()));
                continue;
            }

            const auto decision = classify_project(project);
            if (!decision.is_test) {
                log_.trc("not a test project", redlog::field("project", project.name));
                continue;
            }

            if (name_filtered_out(project.name, options)) {
                log_.dbg("test project filtered out", redlog::field("project", project.name));
                continue;
            }

            log_.dbg("selected test project", redlog::field("project", project.name),
                     redlog::field("signal", to_string(decision.signal)),
                     redlog::field("evidence", decision.evidence));
            selected.push_back(project.path);
        }

        std::ranges::sort(selected);
        const auto dup = std::ranges::unique(selected);
        selected.erase(dup.begin(), dup.end());
        return selected;
    }

}  // namespace cova::discovery
