//
// Created by gregorian-rayne on 1/17/26.
//

#include "cova/cli/session.hpp"
#include "cova/utils/file_utils.hpp"

#include <gtest/gtest.h>

#include <filesystem>

namespace fs = std::filesystem;
using namespace cova;
using namespace cova::cli;

class SessionOptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "cova_session_options_test";
        fs::remove_all(temp_dir);
        fs::create_directories(temp_dir);
        config = core::Config::default_config();
    }

    void TearDown() override {
        fs::remove_all(temp_dir);
    }

    static ParsedArgs parse(const std::vector<std::string>& argv) {
        auto defs = analysis_arguments();
        for (auto& def : session_arguments()) {
            defs.push_back(std::move(def));
        }
        auto parsed = parse_arguments(argv, defs);
        EXPECT_TRUE(parsed.success) << parsed.error;
        return parsed.args;
    }

    fs::path temp_dir;
    core::Config config;
};

TEST_F(SessionOptionsTest, ConfigDefaultsWithoutFlags) {
    config.analysis.timeout_minutes = 25;
    config.analysis.excluded_files = {"*.g.cs"};

    auto options = build_options(config, parse({}));
    ASSERT_TRUE(options.is_ok()) << options.error().to_string();
    EXPECT_EQ(options.value(), config.analysis);
}

TEST_F(SessionOptionsTest, ListsAppendToConfiguredValues) {
    config.analysis.excluded_files = {"*.g.cs"};

    auto options = build_options(config, parse({
        "--exclude-file", "Migrations/*, *.Designer.cs",
        "--include-project", "Shop.Core,,Shop.Api",
        "--exclude-test-project", "Shop.E2E.Tests"
    }));
    ASSERT_TRUE(options.is_ok());

    const std::vector<std::string> files = {"*.g.cs", "Migrations/*", "*.Designer.cs"};
    const std::vector<std::string> projects = {"Shop.Core", "Shop.Api"};
    EXPECT_EQ(options.value().excluded_files, files);
    EXPECT_EQ(options.value().included_projects, projects);
    ASSERT_EQ(options.value().excluded_test_projects.size(), 1u);
    EXPECT_TRUE(options.value().excluded_projects.empty());
}

TEST_F(SessionOptionsTest, FlagsOverrideConfig) {
    auto options = build_options(config, parse({
        "--sequential", "--no-branches", "--no-methods", "--include-generated",
        "--filter", "Category!=Slow", "--timeout", "3", "--json"
    }));
    ASSERT_TRUE(options.is_ok());

    const auto& o = options.value();
    EXPECT_FALSE(o.run_in_parallel);
    EXPECT_FALSE(o.collect_branch_coverage);
    EXPECT_FALSE(o.collect_method_coverage);
    EXPECT_TRUE(o.include_generated_code);
    EXPECT_EQ(o.test_filter, std::optional<std::string>("Category!=Slow"));
    EXPECT_EQ(o.timeout_minutes, 3);
    EXPECT_EQ(o.output_format, "json");
}

TEST_F(SessionOptionsTest, NonNumericTimeout) {
    auto options = build_options(config, parse({"--timeout", "soon"}));
    ASSERT_TRUE(options.is_err());
    EXPECT_EQ(options.error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(options.error().message(), "--timeout expects a whole number of minutes");
}

TEST_F(SessionOptionsTest, OutOfRangeTimeoutFailsValidation) {
    auto options = build_options(config, parse({"--timeout", "1441"}));
    ASSERT_TRUE(options.is_err());
    EXPECT_EQ(options.error().code(), ErrorCode::InvalidArgument);
    EXPECT_NE(options.error().message().find("timeout_minutes must be between 1 and 1440"), std::string::npos);
}

TEST_F(SessionOptionsTest, OptionsFileReplacesConfiguredDefaults) {
    config.analysis.timeout_minutes = 25;
    const auto file = temp_dir / "options.json";
    ASSERT_TRUE(file_utils::write_file(file,
        R"({"timeout_minutes": 45, "excluded_projects": ["Shop.Legacy"], "output_format": "text"})").is_ok());

    auto options = build_options(config, parse({"--options", file.string(), "--exclude-project", "Shop.Tools"}));
    ASSERT_TRUE(options.is_ok()) << options.error().to_string();

    const std::vector<std::string> excluded = {"Shop.Legacy", "Shop.Tools"};
    EXPECT_EQ(options.value().timeout_minutes, 45);
    EXPECT_EQ(options.value().excluded_projects, excluded);
    EXPECT_EQ(options.value().output_format, "text");
    EXPECT_TRUE(options.value().collect_branch_coverage);
}

TEST_F(SessionOptionsTest, BadOptionsFileNamesTheFile) {
    const auto file = temp_dir / "options.json";
    ASSERT_TRUE(file_utils::write_file(file, "{ not json").is_ok());

    auto options = build_options(config, parse({"--options", file.string()}));
    ASSERT_TRUE(options.is_err());
    EXPECT_EQ(options.error().code(), ErrorCode::ParseError);
    EXPECT_EQ(options.error().context().value_or(""), file.string());
}

TEST_F(SessionOptionsTest, MissingOptionsFile) {
    auto options = build_options(config, parse({"--options", (temp_dir / "absent.json").string()}));
    ASSERT_TRUE(options.is_err());
    EXPECT_EQ(options.error().code(), ErrorCode::NotFound);
}

TEST_F(SessionOptionsTest, WorkspacePathPrecedence) {
    config.workspace = (temp_dir / "configured").string();

    EXPECT_EQ(resolve_workspace_path(config, parse({"-w", (temp_dir / "Shop.sln").string()})),
              temp_dir / "Shop.sln");
    EXPECT_EQ(resolve_workspace_path(config, parse({})), temp_dir / "configured");

    config.workspace.clear();
    EXPECT_EQ(resolve_workspace_path(config, parse({})), fs::current_path());
}
