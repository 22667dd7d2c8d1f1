//
// Created by gregorian-rayne on 1/10/26.
//

#include "cova/workspace/workspace.hpp"
#include "cova/utils/file_utils.hpp"
#include "support/coverage_fixtures.hpp"

#include <gtest/gtest.h>

#include <filesystem>

namespace fs = std::filesystem;
using namespace cova;
using namespace cova::workspace;

class WorkspaceLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "cova_workspace_test";
        fs::remove_all(temp_dir);
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    void create_test_file(const fs::path& path, const std::string& content) const {
        ASSERT_TRUE(file_utils::write_file(temp_dir / path, content).is_ok());
    }

    void create_shop() const {
        create_test_file("src/Shop.Api/Shop.Api.csproj", cova::testing::library_project());
        create_test_file("src/Shop.Api/Controllers/OrdersController.cs", "class OrdersController {}");
        create_test_file("src/Shop.Api/obj/Debug/Generated.g.cs", "// generated");
        create_test_file("tests/Shop.Api.Tests/Shop.Api.Tests.csproj", cova::testing::xunit_project());
        create_test_file("tests/Shop.Api.Tests/OrdersTests.cs", "class OrdersTests {}");
    }

    fs::path temp_dir;
};

TEST_F(WorkspaceLoaderTest, LoadsSolution) {
    create_shop();
    create_test_file("Shop.sln",
        "Microsoft Visual Studio Solution File, Format Version 12.00\n"
        "Project(\"{FAE04EC0-301F-11D3-BF4B-00C04F79EFBC}\") = \"Shop.Api\", \"src\\Shop.Api\\Shop.Api.csproj\", \"{11111111-1111-1111-1111-111111111111}\"\n"
        "EndProject\n"
        "Project(\"{FAE04EC0-301F-11D3-BF4B-00C04F79EFBC}\") = \"Shop.Api.Tests\", \"tests\\Shop.Api.Tests\\Shop.Api.Tests.csproj\", \"{22222222-2222-2222-2222-222222222222}\"\n"
        "EndProject\n"
        "Project(\"{2150E333-8FDC-42A3-9474-1A3956D46DE8}\") = \"Solution Items\", \"Solution Items\", \"{33333333-3333-3333-3333-333333333333}\"\n"
        "EndProject\n");

    auto ws = WorkspaceLoader::load(temp_dir / "Shop.sln");
    ASSERT_TRUE(ws.is_ok()) << ws.error().to_string();

    EXPECT_EQ(ws.value().solution.filename(), "Shop.sln");
    ASSERT_EQ(ws.value().projects.size(), 2u);
    EXPECT_EQ(ws.value().projects[0].name, "Shop.Api");
    EXPECT_EQ(ws.value().projects[1].name, "Shop.Api.Tests");
    EXPECT_TRUE(ws.value().projects[0].is_loaded());
}

TEST_F(WorkspaceLoaderTest, LoadsDirectory) {
    create_shop();

    auto ws = WorkspaceLoader::load(temp_dir);
    ASSERT_TRUE(ws.is_ok());
    ASSERT_EQ(ws.value().projects.size(), 2u);
    EXPECT_TRUE(ws.value().solution.empty());

    const auto* api = ws.value().find_project("shop.api");
    ASSERT_NE(api, nullptr);
    ASSERT_EQ(api->packages.size(), 1u);
    EXPECT_EQ(api->packages[0].name, "Newtonsoft.Json");
    EXPECT_EQ(api->packages[0].version, "13.0.3");

    // SDK projects compile every .cs outside bin/obj.
    ASSERT_EQ(api->source_files.size(), 1u);
    EXPECT_EQ(api->source_files[0].filename(), "OrdersController.cs");

    EXPECT_EQ(ws.value().find_project("Missing"), nullptr);
}

TEST_F(WorkspaceLoaderTest, LoadsSingleProject) {
    create_shop();

    auto ws = WorkspaceLoader::load(temp_dir / "tests/Shop.Api.Tests/Shop.Api.Tests.csproj");
    ASSERT_TRUE(ws.is_ok());
    ASSERT_EQ(ws.value().projects.size(), 1u);
    EXPECT_EQ(ws.value().projects[0].packages.size(), 3u);
}

TEST_F(WorkspaceLoaderTest, MissingPathIsNotFound) {
    auto ws = WorkspaceLoader::load(temp_dir / "Nope.sln");
    ASSERT_TRUE(ws.is_err());
    EXPECT_EQ(ws.error().code(), ErrorCode::NotFound);
    EXPECT_EQ(ws.error().message(), "Workspace path not found");
}

TEST_F(WorkspaceLoaderTest, UnsupportedFileIsInvalidArgument) {
    create_test_file("notes.txt", "hello");
    auto ws = WorkspaceLoader::load(temp_dir / "notes.txt");
    ASSERT_TRUE(ws.is_err());
    EXPECT_EQ(ws.error().code(), ErrorCode::InvalidArgument);
}

TEST_F(WorkspaceLoaderTest, ManifestDetails) {
    const std::string manifest =
        "<Project Sdk=\"Microsoft.NET.Sdk\">\n"
        "  <PropertyGroup>\n"
        "    <AssemblyName>Shop.Core.Specs</AssemblyName>\n"
        "    <IsTestProject> True </IsTestProject>\n"
        "  </PropertyGroup>\n"
        "  <ItemGroup>\n"
        "    <PackageReference Include=\"NUnit\">\n"
        "      <Version>3.14.0</Version>\n"
        "    </PackageReference>\n"
        "    <ProjectReference Include=\"..\\Shop.Core\\Shop.Core.csproj\" />\n"
        "  </ItemGroup>\n"
        "</Project>\n";

    const auto project = WorkspaceLoader::parse_project_manifest(manifest, temp_dir / "Specs" / "Specs.csproj");

    EXPECT_TRUE(project.is_loaded());
    EXPECT_EQ(project.name, "Shop.Core.Specs");
    ASSERT_EQ(project.packages.size(), 1u);
    EXPECT_EQ(project.packages[0].version, "3.14.0");
    ASSERT_EQ(project.project_references.size(), 1u);
    EXPECT_EQ(project.project_references[0], "../Shop.Core/Shop.Core.csproj");
    EXPECT_EQ(project.is_test_project, std::optional<bool>(true));
}

TEST_F(WorkspaceLoaderTest, PropertyReferenceInAssemblyNameIgnored) {
    const auto project = WorkspaceLoader::parse_project_manifest(
        "<Project><PropertyGroup><AssemblyName>$(MSBuildProjectName).Core</AssemblyName></PropertyGroup></Project>",
        temp_dir / "Billing.csproj");
    EXPECT_EQ(project.name, "Billing");
}

TEST_F(WorkspaceLoaderTest, LegacyCompileItems) {
    const auto project = WorkspaceLoader::parse_project_manifest(
        "<Project ToolsVersion=\"15.0\"><ItemGroup>"
        "<Compile Include=\"Properties\\AssemblyInfo.cs\" />"
        "<Compile Include=\"Billing.cs\" />"
        "<Compile Include=\"Generated\\*.cs\" />"
        "</ItemGroup></Project>",
        temp_dir / "Billing" / "Billing.csproj");

    ASSERT_EQ(project.source_files.size(), 2u);
    EXPECT_EQ(project.source_files[0], temp_dir / "Billing" / "Billing.cs");
}

TEST_F(WorkspaceLoaderTest, MalformedManifestRecordsError) {
    create_test_file("Broken/Broken.csproj", "<Project><ItemGroup>");
    create_test_file("Other/Other.csproj", "<Build/>");

    auto ws = WorkspaceLoader::load(temp_dir);
    ASSERT_TRUE(ws.is_ok());
    ASSERT_EQ(ws.value().projects.size(), 2u);
    for (const auto& project : ws.value().projects) {
        EXPECT_FALSE(project.is_loaded()) << project.name;
    }
    EXPECT_NE(ws.value().projects[1].load_error->find("expected <Project>"), std::string::npos);
}

TEST_F(WorkspaceLoaderTest, SolutionSkipsNonCsharpEntries) {
    create_test_file("Mixed.sln",
        "Project(\"{8BC9CEB8-8B4A-11D0-8D11-00A0C91BC942}\") = \"Native\", \"native\\Native.vcxproj\", \"{44444444-4444-4444-4444-444444444444}\"\n"
        "EndProject\n");

    auto manifests = WorkspaceLoader::parse_solution(temp_dir / "Mixed.sln");
    ASSERT_TRUE(manifests.is_ok());
    EXPECT_TRUE(manifests.value().empty());
}
