//
// Created by gregorian-rayne on 1/12/26.
//

#ifndef COVA_COBERTURA_PARSER_HPP
#define COVA_COBERTURA_PARSER_HPP

/**
 * @file cobertura_parser.hpp
 * @brief Turns Cobertura XML reports into coverage trees.
 *
 * Report layout:
 *
 * @code
 *     <coverage line-rate=".." branch-rate="..">
 *       <sources><source>/src</source></sources>
 *       <packages>
 *         <package name="MyApp">
 *           <classes>
 *             <class name="MyApp.Calculator" filename="Calculator.cs" line-rate=".." branch-rate="..">
 *               <methods>
 *                 <method name="Add" signature="(System.Int32,System.Int32)" line-rate="1" branch-rate="1">
 *                   <lines><line number="10" hits="3"/></lines>
 *                 </method>
 *               </methods>
 *               <lines>
 *                 <line number="10" hits="3"/>
 *                 <line number="11" hits="0" branch="true" condition-coverage="50% (1/2)">
 *                   <conditions><condition number="0" type="jump" coverage="50%"/></conditions>
 *                 </line>
 *               </lines>
 *             </class>
 *           </classes>
 *         </package>
 *       </packages>
 *     </coverage>
 * @endcode
 *
 * Each package becomes one ProjectCoverage. Class and method percentages
 * are the reported rates times 100; every count is derived from child
 * lines. Malformed line, method or class elements are skipped and logged;
 * only an unreadable document fails the parse.
 */

#include "cova/result.hpp"
#include "cova/error.hpp"
#include "cova/types.hpp"
#include "cova/xml/xml_document.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace cova::parsers {

    struct ReportParseOptions {
        bool collect_branches = true;
        bool collect_methods = true;
        bool include_generated = false;
        std::vector<std::string> excluded_files;

        static ReportParseOptions from(const CoverageAnalysisOptions& options);
    };

    /**
     * True for designer output, source generator output and assembly
     * attribute files.
     */
    [[nodiscard]] bool is_generated_file(std::string_view path);

    /**
     * True for compiler-generated type names such as closures and state
     * machines ("<>c", "<Bar>d__3"). Unless generated code is kept as
     * reported, such nested types are folded into their declaring class.
     */
    [[nodiscard]] bool is_generated_type(std::string_view name);

    /**
     * Patterns with '*' or '?' are globs, matched against the whole
     * normalized path and against the file name. Other patterns match as
     * a path suffix. Matching ignores case.
     */
    [[nodiscard]] bool is_excluded_file(std::string_view path, const std::vector<std::string>& patterns);

    /**
     * Reads a rate attribute ("0.85") as a rounded percentage (85.0).
     * Missing or malformed rates read as 0.
     */
    [[nodiscard]] double rate_to_percentage(const std::optional<std::string>& rate);

    /**
     * Parses a <line>. number is required and must be positive; hits
     * defaults to 0 when missing or malformed.
     */
    [[nodiscard]] Result<LineCoverage, Error> parse_line(const xml::XmlNode& node);

    /**
     * Expands a branch <line> into one entry per outcome. Uses
     * condition-coverage="50% (1/2)" for the counts. Outcomes take their
     * kind and condition text from the <condition> entries in order, and
     * fall back to the condition-coverage value when there are none.
     * Returns empty for non-branch lines.
     */
    [[nodiscard]] std::vector<BranchCoverage> parse_line_branches(const xml::XmlNode& node, int line_hits);

    [[nodiscard]] Result<MethodCoverage, Error> parse_method(const xml::XmlNode& node,
                                                             const std::string& class_name,
                                                             const ReportParseOptions& options = {});

    [[nodiscard]] Result<ClassCoverage, Error> parse_class(const xml::XmlNode& node,
                                                           const ReportParseOptions& options = {});

    /**
     * Parses a <package>. Filtered and malformed classes are dropped.
     * A package without classes yields an empty, zero-summary project.
     */
    [[nodiscard]] ProjectCoverage parse_package(const xml::XmlNode& node,
                                                const std::string& report_path,
                                                const ReportParseOptions& options = {});

    /**
     * Parses a whole report held in memory. The root element must be
     * <coverage>. Source text for each line is filled in when the files
     * listed under <sources> are readable.
     *
     * @param content Report XML.
     * @param report_path Path recorded on each project and used in errors.
     */
    [[nodiscard]] Result<std::vector<ProjectCoverage>, Error> parse_report(std::string_view content,
                                                                          const std::string& report_path,
                                                                          const ReportParseOptions& options = {});

    [[nodiscard]] Result<std::vector<ProjectCoverage>, Error> parse_report_file(const fs::path& path,
                                                                               const ReportParseOptions& options = {});

}  // namespace cova::parsers

#endif //COVA_COBERTURA_PARSER_HPP
