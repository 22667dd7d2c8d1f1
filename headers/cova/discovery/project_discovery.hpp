//
// Created by gregorian-rayne on 1/10/26.
//

#ifndef COVA_PROJECT_DISCOVERY_HPP
#define COVA_PROJECT_DISCOVERY_HPP

/**
 * @file project_discovery.hpp
 * @brief Test vs. production project classification.
 *
 * Classification looks only at already-loaded metadata. The decision
 * records which signal settled it, in priority order:
 *
 * 1. An explicit <IsTestProject>true</IsTestProject>. A false value
 *    settles nothing and the later signals still apply.
 * 2. A test framework package (Microsoft.NET.Test.Sdk, xunit*, NUnit*,
 *    MSTest*, TUnit*). Coverage collectors alone do not count.
 * 3. The project name follows a test naming convention
 *    ("Foo.Tests", "FooTests", "foo-test", "Foo.Specs").
 *
 * Anything else is a production project.
 */

#include "cova/types.hpp"
#include "cova/workspace/workspace.hpp"

#include <string>
#include <vector>

namespace cova::discovery {

    enum class TestSignal {
        None,
        ExplicitFlag,
        FrameworkPackage,
        NamingConvention
    };

    inline const char* to_string(TestSignal signal) noexcept {
        switch (signal) {
            case TestSignal::None:             return "none";
            case TestSignal::ExplicitFlag:     return "explicit flag";
            case TestSignal::FrameworkPackage: return "framework package";
            case TestSignal::NamingConvention: return "naming convention";
        }
        return "none";
    }

    struct Classification {
        bool is_test = false;
        TestSignal signal = TestSignal::None;
        /// Package name, flag value or name that decided it.
        std::string evidence;
    };

    [[nodiscard]] bool is_test_framework_package(const std::string& package_name);

    [[nodiscard]] bool follows_test_naming(const std::string& project_name);

    [[nodiscard]] Classification classify_project(const workspace::ProjectInfo& project);

    /**
     * Selected test project manifests, sorted lexicographically by path.
     *
     * Unreadable projects are skipped and logged. Name filters from the
     * options (excluded_projects, excluded_test_projects and a non-empty
     * included_test_projects) match case-insensitively.
     */
    [[nodiscard]] std::vector<fs::path> select_test_projects(
        const std::vector<workspace::ProjectInfo>& projects,
        const CoverageAnalysisOptions& options
    );

}  // namespace cova::discovery

#endif //COVA_PROJECT_DISCOVERY_HPP
