//
// Created by gregorian-rayne on 1/10/26.
//

#include "cova/discovery/project_discovery.hpp"

#include <gtest/gtest.h>

using namespace cova;
using namespace cova::discovery;
using cova::workspace::ProjectInfo;

namespace {

    ProjectInfo project(const std::string& name,
                        const std::vector<std::string>& packages = {},
                        const std::optional<bool> explicit_flag = std::nullopt) {
        ProjectInfo info;
        info.name = name;
        info.path = "/repo/" + name + "/" + name + ".csproj";
        for (const auto& package : packages) {
            info.packages.push_back({package, "1.0.0"});
        }
        info.is_test_project = explicit_flag;
        return info;
    }

    struct ClassificationCase {
        const char* label;
        ProjectInfo info;
        bool is_test;
        TestSignal signal;
    };

}  // namespace

TEST(ProjectDiscoveryTest, ClassificationTable) {
    const std::vector<ClassificationCase> cases = {
        {"plain library", project("Shop.Core", {"Newtonsoft.Json"}), false, TestSignal::None},
        {"xunit package", project("Shop.Verification", {"xunit"}), true, TestSignal::FrameworkPackage},
        {"nunit adapter", project("Checks", {"NUnit3TestAdapter"}), true, TestSignal::FrameworkPackage},
        {"mstest", project("Checks", {"MSTest.TestFramework"}), true, TestSignal::FrameworkPackage},
        {"test sdk", project("Checks", {"Microsoft.NET.Test.Sdk"}), true, TestSignal::FrameworkPackage},
        {"tests suffix", project("Shop.Api.Tests"), true, TestSignal::NamingConvention},
        {"pascal suffix", project("ShopApiTests"), true, TestSignal::NamingConvention},
        {"specs segment", project("Shop.Specs"), true, TestSignal::NamingConvention},
        {"contest is not a test", project("Contest"), false, TestSignal::None},
        {"explicit false keeps packages", project("Shop.Checks", {"xunit"}, false), true, TestSignal::FrameworkPackage},
        {"explicit false keeps naming", project("Shop.Tests", {}, false), true, TestSignal::NamingConvention},
        {"explicit false on library", project("Shop.Core", {}, false), false, TestSignal::None},
        {"explicit true wins", project("Shop.Harness", {}, true), true, TestSignal::ExplicitFlag},
        {"package beats name", project("Shop.Tests", {"xunit.core"}), true, TestSignal::FrameworkPackage},
    };

    for (const auto& c : cases) {
        const auto decision = classify_project(c.info);
        EXPECT_EQ(decision.is_test, c.is_test) << c.label;
        EXPECT_EQ(decision.signal, c.signal) << c.label;
    }
}

TEST(ProjectDiscoveryTest, EvidenceNamesTheSignal) {
    EXPECT_EQ(classify_project(project("A", {"xunit.runner.visualstudio"})).evidence, "xunit.runner.visualstudio");
    EXPECT_EQ(classify_project(project("A", {}, true)).evidence, "IsTestProject=true");
    EXPECT_EQ(classify_project(project("A.UnitTests")).evidence, "A.UnitTests");
    EXPECT_STREQ(to_string(TestSignal::FrameworkPackage), "framework package");
}

TEST(ProjectDiscoveryTest, FrameworkPackages) {
    EXPECT_TRUE(is_test_framework_package("xunit.assert"));
    EXPECT_TRUE(is_test_framework_package("TUnit"));
    EXPECT_TRUE(is_test_framework_package("microsoft.net.test.sdk"));
    EXPECT_FALSE(is_test_framework_package("Moq"));
    EXPECT_FALSE(is_test_framework_package("FluentAssertions"));
    EXPECT_FALSE(is_test_framework_package("Microsoft.NET.Sdk"));
}

TEST(ProjectDiscoveryTest, NamingConvention) {
    EXPECT_TRUE(follows_test_naming("Api.IntegrationTests"));
    EXPECT_TRUE(follows_test_naming("api-tests"));
    EXPECT_TRUE(follows_test_naming("Shop_Test"));
    EXPECT_TRUE(follows_test_naming("PaymentTest"));
    EXPECT_FALSE(follows_test_naming("Testing.Utilities"));
    EXPECT_FALSE(follows_test_naming("Latest"));
}

TEST(ProjectDiscoveryTest, SelectsOnlyLoadedTestProjects) {
    auto broken = project("Broken.Tests");
    broken.load_error = "Malformed XML";

    const std::vector<ProjectInfo> projects = {
        project("Shop.Core"),
        project("Shop.Core.Tests", {"xunit"}),
        broken,
        project("Shop.Api.Tests", {"nunit"}),
    };

    const auto selected = select_test_projects(projects, {});
    ASSERT_EQ(selected.size(), 2u);
    EXPECT_EQ(selected[0].filename(), "Shop.Api.Tests.csproj");
    EXPECT_EQ(selected[1].filename(), "Shop.Core.Tests.csproj");
}

TEST(ProjectDiscoveryTest, FiltersApply) {
    const std::vector<ProjectInfo> projects = {
        project("Shop.Core.Tests", {"xunit"}),
        project("Shop.Api.Tests", {"xunit"}),
        project("Shop.E2E.Tests", {"xunit"}),
    };

    CoverageAnalysisOptions exclude;
    exclude.excluded_test_projects = {"shop.e2e.tests"};
    EXPECT_EQ(select_test_projects(projects, exclude).size(), 2u);

    CoverageAnalysisOptions include;
    include.included_test_projects = {"Shop.Api.Tests"};
    const auto only_api = select_test_projects(projects, include);
    ASSERT_EQ(only_api.size(), 1u);
    EXPECT_EQ(only_api[0].stem(), "Shop.Api.Tests");

    CoverageAnalysisOptions excluded_everywhere;
    excluded_everywhere.excluded_projects = {"Shop.Core.Tests"};
    EXPECT_EQ(select_test_projects(projects, excluded_everywhere).size(), 2u);
}

TEST(ProjectDiscoveryTest, DuplicatePathsCollapse) {
    const std::vector<ProjectInfo> projects = {
        project("Shop.Tests", {"xunit"}),
        project("Shop.Tests", {"xunit"}),
    };
    EXPECT_EQ(select_test_projects(projects, {}).size(), 1u);
}
