//
// Created by gregorian-rayne on 1/15/26.
//

#ifndef COVA_TESTS_COVERAGE_FIXTURES_HPP
#define COVA_TESTS_COVERAGE_FIXTURES_HPP

/**
 * @file coverage_fixtures.hpp
 * @brief Shared fixtures for coverage tests.
 *
 * Provides a small Cobertura report for a "Calculator" package, project
 * manifests, and a test driver backed by /bin/sh that replays a recorded
 * transcript and drops a report into the results directory.
 */

#include "cova/runner/test_driver.hpp"
#include "cova/utils/file_utils.hpp"
#include "cova/workspace/workspace.hpp"

#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace cova::testing {

    /**
     * Cobertura report with two classes in Calculator.cs and Formatter.cs,
     * plus a source-generator class under obj/.
     *
     * Calculator.Reset is uncovered unless @p reset_covered is set.
     */
    inline std::string calculator_report(const bool reset_covered = false,
                                         const std::string& package_name = "Calculator") {
        const std::string reset_hits = reset_covered ? "1" : "0";
        const std::string reset_rate = reset_covered ? "1" : "0";
        const std::string class_rate = reset_covered ? "0.8333" : "0.5";

        return R"xml(<?xml version="1.0" encoding="utf-8"?>
<coverage line-rate="0.5714" branch-rate="0.5" version="1.9" timestamp="1700000000">
  <sources>
    <source>/nonexistent/cova-fixture-sources/</source>
  </sources>
  <packages>
    <package name=")xml" + package_name + R"xml(" line-rate="0.5714" branch-rate="0.5" complexity="6">
      <classes>
        <class name="Calc.Core.Calculator" filename="src/Calculator/Calculator.cs" line-rate=")xml" + class_rate + R"xml(" branch-rate="0.5" complexity="4">
          <methods>
            <method name="Add" signature="(System.Int32,System.Int32)" line-rate="1" branch-rate="1" complexity="1">
              <lines>
                <line number="10" hits="3" branch="false" />
                <line number="11" hits="3" branch="false" />
              </lines>
            </method>
            <method name="Divide" signature="(System.Int32,System.Int32)" line-rate="0.5" branch-rate="0.5" complexity="2">
              <lines>
                <line number="15" hits="2" branch="false" />
                <line number="16" hits="0" branch="true" condition-coverage="50% (1/2)">
                  <conditions>
                    <condition number="0" type="jump" coverage="50%" />
                  </conditions>
                </line>
              </lines>
            </method>
            <method name="Reset" signature="()" line-rate=")xml" + reset_rate + R"xml(" branch-rate="1" complexity="1">
              <lines>
                <line number="20" hits=")xml" + reset_hits + R"xml(" branch="false" />
                <line number="21" hits=")xml" + reset_hits + R"xml(" branch="false" />
              </lines>
            </method>
          </methods>
          <lines>
            <line number="10" hits="3" branch="false" />
            <line number="11" hits="3" branch="false" />
            <line number="15" hits="2" branch="false" />
            <line number="16" hits="0" branch="true" condition-coverage="50% (1/2)">
              <conditions>
                <condition number="0" type="jump" coverage="50%" />
              </conditions>
            </line>
            <line number="20" hits=")xml" + reset_hits + R"xml(" branch="false" />
            <line number="21" hits=")xml" + reset_hits + R"xml(" branch="false" />
          </lines>
        </class>
        <class name="Calc.Core.CalculatorPatterns" filename="obj/Debug/net8.0/CalculatorPatterns.g.cs" line-rate="0" branch-rate="1" complexity="1">
          <methods />
          <lines>
            <line number="30" hits="0" branch="false" />
          </lines>
        </class>
        <class name="Calc.Core.Formatter" filename="src/Calculator/Formatter.cs" line-rate="1" branch-rate="1" complexity="1">
          <methods>
            <method name="Format" signature="(System.Double)" line-rate="1" branch-rate="1" complexity="1">
              <lines>
                <line number="5" hits="4" branch="false" />
              </lines>
            </method>
          </methods>
          <lines>
            <line number="5" hits="4" branch="false" />
          </lines>
        </class>
      </classes>
    </package>
  </packages>
</coverage>
)xml";
    }

    /**
     * Console transcript of a passing run for the report above.
     */
    inline std::vector<std::string> passing_transcript(const int total = 4) {
        return {
            "  Determining projects to restore...",
            "  Calculator.Tests -> /src/Calculator.Tests/bin/Debug/net8.0/Calculator.Tests.dll",
            "Test run for /src/Calculator.Tests/bin/Debug/net8.0/Calculator.Tests.dll (.NETCoreApp,Version=v8.0)",
            "Starting test execution, please wait...",
            "Passed!  - Failed:     0, Passed:     " + std::to_string(total) + ", Skipped:     0, Total:     " +
                std::to_string(total) + ", Duration: 1 s - Calculator.Tests.dll (net8.0)",
        };
    }

    inline std::string sdk_project(const std::string& packages_xml, const std::string& properties_xml = "") {
        return "<Project Sdk=\"Microsoft.NET.Sdk\">\n"
               "  <PropertyGroup>\n"
               "    <TargetFramework>net8.0</TargetFramework>\n" +
               properties_xml +
               "  </PropertyGroup>\n"
               "  <ItemGroup>\n" +
               packages_xml +
               "  </ItemGroup>\n"
               "</Project>\n";
    }

    inline std::string xunit_project() {
        return sdk_project("    <PackageReference Include=\"Microsoft.NET.Test.Sdk\" Version=\"17.8.0\" />\n"
                           "    <PackageReference Include=\"xunit\" Version=\"2.6.2\" />\n"
                           "    <PackageReference Include=\"coverlet.collector\" Version=\"6.0.0\" />\n");
    }

    inline std::string library_project() {
        return sdk_project("    <PackageReference Include=\"Newtonsoft.Json\" Version=\"13.0.3\" />\n");
    }

    /**
     * In-memory project with the given name under @p dir.
     */
    inline workspace::ProjectInfo make_project(const fs::path& dir, const std::string& name, const bool is_test) {
        workspace::ProjectInfo project;
        project.name = name;
        project.path = dir / name / (name + ".csproj");
        if (is_test) {
            project.packages.push_back({"xunit", "2.6.2"});
        }
        return project;
    }

    /**
     * Test driver that replays scripted behavior through /bin/sh.
     *
     * Each project stem maps to a transcript, an optional report and an
     * exit code. Unknown projects exit with status 1 and no report.
     */
    class ScriptTestDriver final : public runner::ITestDriver {
    public:
        struct Behavior {
            std::vector<std::string> transcript;
            std::optional<std::string> report;
            int exit_code = 0;
            int sleep_seconds = 0;
        };

        explicit ScriptTestDriver(fs::path scratch) : scratch_(std::move(scratch)) {}

        [[nodiscard]] std::string name() const override { return "script"; }

        void set(const std::string& project_stem, const Behavior& behavior) {
            Prepared prepared;
            prepared.transcript = scratch_ / (project_stem + ".log");
            std::string text;
            for (const auto& line : behavior.transcript) {
                text += line + "\n";
            }
            if (auto written = file_utils::write_file(prepared.transcript, text); written.is_err()) {
                throw std::runtime_error(written.error().to_string());
            }

            if (behavior.report) {
                prepared.report = scratch_ / (project_stem + ".xml");
                if (auto written = file_utils::write_file(*prepared.report, *behavior.report); written.is_err()) {
                    throw std::runtime_error(written.error().to_string());
                }
            }
            prepared.exit_code = behavior.exit_code;
            prepared.sleep_seconds = behavior.sleep_seconds;

            std::lock_guard lock(mutex_);
            prepared_[project_stem] = prepared;
        }

        [[nodiscard]] runner::ProcessSpec build_invocation(
            const fs::path& project,
            const fs::path& results_dir,
            const CoverageAnalysisOptions& options
        ) const override {
            std::optional<Prepared> prepared;
            {
                std::lock_guard lock(mutex_);
                ++invocations_;
                last_filter_ = options.test_filter;
                if (const auto it = prepared_.find(project.stem().string()); it != prepared_.end()) {
                    prepared = it->second;
                }
            }

            runner::ProcessSpec spec;
            if (!prepared) {
                spec.argv = {"/bin/sh", "-c", "echo 'error: no tests configured' >&2; exit 1"};
                return spec;
            }

            std::string script = "cat \"$1\"";
            if (prepared->sleep_seconds > 0) {
                script += "; sleep " + std::to_string(prepared->sleep_seconds);
            }
            if (prepared->report) {
                script += "; mkdir -p \"$2/0f8fad5b\" && cp \"$3\" \"$2/0f8fad5b/coverage.cobertura.xml\"";
            }
            script += "; exit " + std::to_string(prepared->exit_code);

            spec.argv = {
                "/bin/sh", "-c", script, "sh",
                prepared->transcript.string(),
                results_dir.string(),
                prepared->report ? prepared->report->string() : std::string{}
            };
            return spec;
        }

        [[nodiscard]] int invocations() const {
            std::lock_guard lock(mutex_);
            return invocations_;
        }

        [[nodiscard]] std::optional<std::string> last_filter() const {
            std::lock_guard lock(mutex_);
            return last_filter_;
        }

    private:
        struct Prepared {
            fs::path transcript;
            std::optional<fs::path> report;
            int exit_code = 0;
            int sleep_seconds = 0;
        };

        fs::path scratch_;
        mutable std::mutex mutex_;
        std::map<std::string, Prepared> prepared_;
        mutable int invocations_ = 0;
        mutable std::optional<std::string> last_filter_;
    };

}  // namespace cova::testing

#endif //COVA_TESTS_COVERAGE_FIXTURES_HPP
