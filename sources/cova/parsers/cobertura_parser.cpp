//
// Created by gregorian-rayne on 1/12/26.
//

#include "cova/parsers/cobertura_parser.hpp"
#include "cova/analysis/aggregator.hpp"
#include "cova/utils/file_utils.hpp"
#include "cova/utils/path_utils.hpp"
#include "cova/utils/string_utils.hpp"

#include <redlog.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <iterator>
#include <map>
#include <regex>

namespace cova::parsers {

    namespace {

        redlog::logger log_ = redlog::get_logger("cova.parsers.cobertura");

        constexpr std::string_view kGeneratedSuffixes[] = {
            ".g.cs", ".g.i.cs", ".designer.cs", ".generated.cs", "assemblyinfo.cs"
        };

        /**
         * Hit counts beyond int range saturate instead of reading as 0.
         */
        int parse_hits(const std::optional<std::string>& attr) {
            if (!attr) {
                return 0;
            }
            const auto text = string_utils::trim(*attr);
            if (text.empty() || !std::ranges::all_of(text, [](const unsigned char c) { return std::isdigit(c); })) {
                return 0;
            }

            long long value = 0;
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec == std::errc::result_out_of_range || value > std::numeric_limits<int>::max()) {
                return std::numeric_limits<int>::max();
            }
            if (ec != std::errc() || ptr != text.data() + text.size()) {
                return 0;
            }
            return static_cast<int>(value);
        }

        BranchType branch_type_from_condition(const std::string& type) {
            if (string_utils::iequals(type, "switch")) {
                return BranchType::Switch;
            }
            return BranchType::Conditional;
        }

        // <condition number="14" type="jump" coverage="50%"/> -> "jump #14 (50%)"
        std::string condition_text(const xml::XmlNode& condition) {
            const auto type = condition.attribute("type").value_or("");
            const auto number = condition.attribute("number").value_or("");
            const auto coverage = condition.attribute("coverage").value_or("");
            if (type.empty() && number.empty()) {
                return {};
            }
            std::string text = type.empty() ? std::string("condition") : type;
            if (!number.empty()) {
                text += " #" + number;
            }
            if (!coverage.empty()) {
                text += " (" + coverage + ")";
            }
            return text;
        }

        /**
         * Parses "<lines><line .../></lines>" under @p parent, skipping
         * bad entries. Branch outcomes go to @p branches when requested.
         */
        std::vector<LineCoverage> parse_lines_of(const xml::XmlNode& parent,
                                                 std::vector<BranchCoverage>* branches) {
            std::vector<LineCoverage> lines;
            const auto container = parent.first_child("lines");
            if (!container) {
                return lines;
            }

            for (const auto& node : container->children("line")) {
                auto line = parse_line(node);
                if (line.is_err()) {
                    log_.wrn("skipping malformed line", redlog::field("element_line", node.line()),
                             redlog::field("error", line.error().message()));
                    continue;
                }
                if (branches) {
                    auto outcomes = parse_line_branches(node, line.value().hit_count);
                    branches->insert(branches->end(), outcomes.begin(), outcomes.end());
                }
                lines.push_back(std::move(line).value());
            }

            std::ranges::sort(lines, {}, &LineCoverage::line_number);
            return lines;
        }

        int count_covered(const std::vector<LineCoverage>& lines) {
            return static_cast<int>(std::ranges::count_if(lines, [](const LineCoverage& l) { return l.is_covered(); }));
        }

        int count_covered(const std::vector<BranchCoverage>& branches) {
            return static_cast<int>(std::ranges::count_if(branches, [](const BranchCoverage& b) { return b.is_covered(); }));
        }

        /**
         * Rate attribute when present, otherwise the count-based value.
         */
        double rate_or_counts(const xml::XmlNode& node, std::string_view attr, int covered, int total) {
            if (const auto rate = node.attribute(attr); rate && string_utils::parse_double(*rate)) {
                return rate_to_percentage(rate);
            }
            return analysis::percentage(covered, total);
        }

        std::string namespace_of(const std::string& class_name) {
            // Nested types are reported as "Ns.Outer/Inner".
            const auto outer = class_name.substr(0, class_name.find('/'));
            const auto dot = outer.rfind('.');
            return dot == std::string::npos ? std::string{} : outer.substr(0, dot);
        }

        /**
         * "Ns.Cart/<CheckoutAsync>d__3" -> "Ns.Cart". Empty for ordinary
         * types and for generated types with no declaring class.
         */
        std::string declaring_class_of(const std::string& name) {
            std::size_t start = 0;
            while (start < name.size()) {
                const auto slash = name.find('/', start);
                const auto segment = std::string_view(name).substr(start, slash == std::string::npos ? slash : slash - start);
                if (is_generated_type(segment)) {
                    return start == 0 ? std::string{} : name.substr(0, start - 1);
                }
                if (slash == std::string::npos) {
                    break;
                }
                start = slash + 1;
            }
            return {};
        }

        /**
         * Async and iterator bodies are compiled into "<Name>d__N" types
         * whose MoveNext holds the user's code; report it as Name.
         */
        void rename_state_machine_methods(ClassCoverage& nested) {
            static const std::regex state_machine(R"(<([^>]+)>d__\d+$)");
            std::smatch match;
            if (!std::regex_search(nested.name, match, state_machine)) {
                return;
            }
            const auto user_name = match[1].str();
            for (auto& method : nested.methods) {
                if (method.name == "MoveNext") {
                    method.name = user_name;
                }
            }
        }

        class SourceResolver {
        public:
            explicit SourceResolver(std::vector<fs::path> roots) : roots_(std::move(roots)) {}

            const std::vector<std::string>* lines_for(const std::string& file_path) {
                const auto [it, inserted] = cache_.try_emplace(file_path);
                if (inserted) {
                    load(file_path, it->second);
                }
                return it->second.empty() ? nullptr : &it->second;
            }

        private:
            void load(const std::string& file_path, std::vector<std::string>& out) const {
                const fs::path path(path_utils::to_forward_slashes(file_path));
                std::vector<fs::path> candidates;
                if (path.is_absolute()) {
                    candidates.push_back(path);
                }
                for (const auto& root : roots_) {
                    candidates.push_back(root / path.relative_path());
                }

                for (const auto& candidate : candidates) {
                    if (std::error_code ec; !fs::is_regular_file(candidate, ec)) {
                        continue;
                    }
                    if (auto lines = file_utils::read_lines(candidate); lines.is_ok()) {
                        out = std::move(lines).value();
                        return;
                    }
                }
            }

            std::vector<fs::path> roots_;
            std::map<std::string, std::vector<std::string>> cache_;
        };

        void fill_source(std::vector<LineCoverage>& lines, const std::vector<std::string>& text) {
            for (auto& line : lines) {
                if (line.line_number >= 1 && static_cast<std::size_t>(line.line_number) <= text.size()) {
                    line.source_code = std::string(string_utils::trim(text[static_cast<std::size_t>(line.line_number) - 1]));
                }
            }
        }

        void attach_sources(ProjectCoverage& project, SourceResolver& resolver) {
            for (auto& cls : project.classes) {
                const auto* text = resolver.lines_for(cls.file_path);
                if (!text) {
                    continue;
                }
                fill_source(cls.lines, *text);
                for (auto& method : cls.methods) {
                    fill_source(method.lines, *text);
                }
            }
        }

    }  // namespace

    ReportParseOptions ReportParseOptions::from(const CoverageAnalysisOptions& options) {
        ReportParseOptions result;
        result.collect_branches = options.collect_branch_coverage;
        result.collect_methods = options.collect_method_coverage;
        result.include_generated = options.include_generated_code;
        result.excluded_files = options.excluded_files;
        return result;
    }

    bool is_generated_file(const std::string_view path) {
        const auto lower = string_utils::to_lower(path_utils::to_forward_slashes(fs::path(std::string(path))));
        if (string_utils::starts_with(lower, "obj/") || string_utils::contains(lower, "/obj/")) {
            return true;
        }
        return std::ranges::any_of(kGeneratedSuffixes, [&lower](const std::string_view suffix) {
            return string_utils::ends_with(lower, suffix);
        });
    }

    bool is_generated_type(const std::string_view name) {
        return string_utils::contains(name, "<") || string_utils::contains(name, "__");
    }

    bool is_excluded_file(const std::string_view path, const std::vector<std::string>& patterns) {
        if (patterns.empty()) {
            return false;
        }

        const auto normalized = string_utils::to_lower(path_utils::normalize_report_path(std::string(path)));
        const auto file_name = fs::path(normalized).filename().string();

        return std::ranges::any_of(patterns, [&](const std::string& raw) {
            const auto pattern = string_utils::to_lower(path_utils::to_forward_slashes(fs::path(raw)));
            if (pattern.empty()) {
                return false;
            }
            if (pattern.find_first_of("*?") != std::string::npos) {
                return string_utils::glob_match(pattern, normalized) || string_utils::glob_match(pattern, file_name);
            }
            if (normalized == pattern) {
                return true;
            }
            return string_utils::ends_with(normalized, pattern) &&
                   (pattern.front() == '/' || normalized[normalized.size() - pattern.size() - 1] == '/');
        });
    }

    double rate_to_percentage(const std::optional<std::string>& rate) {
        if (!rate) {
            return 0.0;
        }
        const auto value = string_utils::parse_double(*rate);
        if (!value || *value < 0.0) {
            return 0.0;
        }
        return analysis::round_percentage(std::min(*value, 1.0) * 100.0);
    }

    Result<LineCoverage, Error> parse_line(const xml::XmlNode& node) {
        const auto number_attr = node.attribute("number");
        if (!number_attr) {
            return Result<LineCoverage, Error>::failure(
                Error::parse_error("line element without number", "element line " + std::to_string(node.line()))
            );
        }

        const auto number = string_utils::parse_int(*number_attr);
        if (!number || *number <= 0) {
            return Result<LineCoverage, Error>::failure(
                Error::parse_error("invalid line number '" + *number_attr + "'",
                                   "element line " + std::to_string(node.line()))
            );
        }

        LineCoverage line;
        line.line_number = *number;
        line.hit_count = parse_hits(node.attribute("hits"));
        line.status = line.hit_count > 0 ? CoverageStatus::Covered : CoverageStatus::Uncovered;
        return Result<LineCoverage, Error>::success(std::move(line));
    }

    std::vector<BranchCoverage> parse_line_branches(const xml::XmlNode& node, const int line_hits) {
        std::vector<BranchCoverage> branches;

        const auto is_branch = node.attribute("branch");
        if (!is_branch || !string_utils::iequals(*is_branch, "true")) {
            return branches;
        }
        const auto number = string_utils::parse_int(node.attribute("number").value_or(""));
        if (!number) {
            return branches;
        }

        const auto condition = node.attribute("condition-coverage").value_or("");
        static const std::regex counts_regex(R"(\((\d+)\s*/\s*(\d+)\))");
        std::smatch match;
        if (!std::regex_search(condition, match, counts_regex)) {
            log_.trc("branch line without counts", redlog::field("line", *number));
            return branches;
        }

        const auto covered = string_utils::parse_int(match[1].str());
        const auto total = string_utils::parse_int(match[2].str());
        if (!covered || !total || *total <= 0 || *covered > *total) {
            log_.wrn("inconsistent condition coverage", redlog::field("line", *number),
                     redlog::field("value", condition));
            return branches;
        }

        std::vector<xml::XmlNode> conditions;
        if (const auto list = node.first_child("conditions")) {
            conditions = list->children("condition");
        }

        branches.reserve(static_cast<std::size_t>(*total));
        for (int i = 0; i < *total; ++i) {
            BranchCoverage branch;
            branch.line_number = *number;
            branch.branch_number = i;
            branch.hit_count = i < *covered ? std::max(line_hits, 1) : 0;
            branch.condition = condition;
            branch.type = BranchType::Conditional;
            if (!conditions.empty()) {
                // Outcomes are spread over the listed conditions in order.
                const auto index = static_cast<std::size_t>(i) * conditions.size() / static_cast<std::size_t>(*total);
                const auto& entry = conditions[index];
                branch.type = branch_type_from_condition(entry.attribute("type").value_or(""));
                if (auto text = condition_text(entry); !text.empty()) {
                    branch.condition = std::move(text);
                }
            }
            branches.push_back(std::move(branch));
        }
        return branches;
    }

    Result<MethodCoverage, Error> parse_method(const xml::XmlNode& node,
                                               const std::string& class_name,
                                               const ReportParseOptions& options) {
        const auto name = node.attribute("name");
        if (!name || name->empty()) {
            return Result<MethodCoverage, Error>::failure(
                Error::parse_error("method element without name", "element line " + std::to_string(node.line()))
            );
        }

        MethodCoverage method;
        method.name = *name;
        method.class_name = class_name;
        method.signature = node.attribute("signature").value_or("");
        method.lines = parse_lines_of(node, options.collect_branches ? &method.branches : nullptr);

        if (!method.lines.empty()) {
            method.start_line = method.lines.front().line_number;
            method.end_line = method.lines.back().line_number;
        }

        auto& summary = method.summary;
        summary.total_lines = static_cast<int>(method.lines.size());
        summary.covered_lines = count_covered(method.lines);
        summary.uncovered_lines = summary.total_lines - summary.covered_lines;
        summary.lines_covered_percentage = rate_or_counts(node, "line-rate", summary.covered_lines, summary.total_lines);

        summary.total_branches = static_cast<int>(method.branches.size());
        summary.covered_branches = count_covered(method.branches);
        summary.uncovered_branches = summary.total_branches - summary.covered_branches;
        summary.branches_covered_percentage =
            rate_or_counts(node, "branch-rate", summary.covered_branches, summary.total_branches);

        summary.total_methods = 1;
        summary.covered_methods = summary.lines_covered_percentage > 0.0 ? 1 : 0;
        summary.uncovered_methods = 1 - summary.covered_methods;
        summary.methods_covered_percentage = summary.covered_methods > 0 ? 100.0 : 0.0;

        return Result<MethodCoverage, Error>::success(std::move(method));
    }

    Result<ClassCoverage, Error> parse_class(const xml::XmlNode& node, const ReportParseOptions& options) {
        const auto name = node.attribute("name");
        if (!name || name->empty()) {
            return Result<ClassCoverage, Error>::failure(
                Error::parse_error("class element without name", "element line " + std::to_string(node.line()))
            );
        }

        ClassCoverage cls;
        cls.name = *name;
        cls.namespace_name = namespace_of(cls.name);
        cls.file_path = node.attribute("filename").value_or("");

        if (options.collect_methods) {
            if (const auto methods = node.first_child("methods")) {
                for (const auto& method_node : methods->children("method")) {
                    auto method = parse_method(method_node, cls.name, options);
                    if (method.is_err()) {
                        log_.wrn("skipping malformed method", redlog::field("class", cls.name),
                                 redlog::field("error", method.error().message()));
                        continue;
                    }
                    cls.methods.push_back(std::move(method).value());
                }
            }
        }

        cls.lines = parse_lines_of(node, options.collect_branches ? &cls.branches : nullptr);

        auto& summary = cls.summary;
        summary.total_lines = static_cast<int>(cls.lines.size());
        summary.covered_lines = count_covered(cls.lines);
        summary.uncovered_lines = summary.total_lines - summary.covered_lines;
        summary.lines_covered_percentage = rate_or_counts(node, "line-rate", summary.covered_lines, summary.total_lines);

        summary.total_branches = static_cast<int>(cls.branches.size());
        summary.covered_branches = count_covered(cls.branches);
        summary.uncovered_branches = summary.total_branches - summary.covered_branches;
        summary.branches_covered_percentage =
            rate_or_counts(node, "branch-rate", summary.covered_branches, summary.total_branches);

        summary.total_methods = static_cast<int>(cls.methods.size());
        summary.covered_methods = static_cast<int>(std::ranges::count_if(cls.methods, [](const MethodCoverage& m) {
            return m.summary.lines_covered_percentage > 0.0;
        }));
        summary.uncovered_methods = summary.total_methods - summary.covered_methods;
        summary.methods_covered_percentage = analysis::percentage(summary.covered_methods, summary.total_methods);

        summary.total_classes = 1;
        summary.covered_classes = summary.lines_covered_percentage > 0.0 ? 1 : 0;
        summary.uncovered_classes = 1 - summary.covered_classes;
        summary.classes_covered_percentage = summary.covered_classes > 0 ? 100.0 : 0.0;

        return Result<ClassCoverage, Error>::success(std::move(cls));
    }

    ProjectCoverage parse_package(const xml::XmlNode& node,
                                  const std::string& report_path,
                                  const ReportParseOptions& options) {
        ProjectCoverage project;
        project.name = node.attribute("name").value_or("");
        project.path = report_path;

        std::vector<std::pair<std::string, ClassCoverage>> nested;

        if (const auto classes = node.first_child("classes")) {
            for (const auto& class_node : classes->children("class")) {
                auto cls = parse_class(class_node, options);
                if (cls.is_err()) {
                    log_.wrn("skipping malformed class", redlog::field("package", project.name),
                             redlog::field("error", cls.error().message()));
                    continue;
                }

                const auto& parsed = cls.value();
                if (!options.include_generated && is_generated_file(parsed.file_path)) {
                    log_.trc("generated file filtered", redlog::field("file", parsed.file_path));
                    continue;
                }
                if (is_excluded_file(parsed.file_path, options.excluded_files)) {
                    log_.trc("excluded file filtered", redlog::field("file", parsed.file_path));
                    continue;
                }
                if (!options.include_generated) {
                    if (auto owner = declaring_class_of(parsed.name); !owner.empty()) {
                        nested.emplace_back(std::move(owner), std::move(cls).value());
                        continue;
                    }
                }
                project.classes.push_back(std::move(cls).value());
            }
        }

        // Closures and state machines hold user code; count it on the declaring class.
        for (auto& [owner, cls] : nested) {
            rename_state_machine_methods(cls);
            auto target = std::ranges::find_if(project.classes, [&owner](const ClassCoverage& c) {
                return c.name == owner;
            });
            if (target == project.classes.end()) {
                ClassCoverage declaring;
                declaring.name = owner;
                declaring.namespace_name = namespace_of(owner);
                declaring.file_path = cls.file_path;
                project.classes.push_back(std::move(declaring));
                target = std::prev(project.classes.end());
            }
            log_.trc("nested type folded", redlog::field("type", cls.name), redlog::field("into", owner));
            analysis::absorb_nested_class(*target, cls);
        }

        analysis::summarize_project(project);
        return project;
    }

    Result<std::vector<ProjectCoverage>, Error> parse_report(const std::string_view content,
                                                            const std::string& report_path,
                                                            const ReportParseOptions& options) {
        auto doc = xml::XmlDocument::parse(content, report_path);
        if (doc.is_err()) {
            return Result<std::vector<ProjectCoverage>, Error>::failure(doc.error());
        }

        const auto root = doc.value().root();
        if (root.name() != "coverage") {
            return Result<std::vector<ProjectCoverage>, Error>::failure(
                Error::parse_error("not a Cobertura report: root element is <" + root.name() + ">", report_path)
            );
        }

        std::vector<fs::path> source_roots;
        if (const auto sources = root.first_child("sources")) {
            for (const auto& source : sources->children("source")) {
                if (const auto text = std::string(string_utils::trim(source.text())); !text.empty()) {
                    source_roots.emplace_back(path_utils::to_forward_slashes(fs::path(text)));
                }
            }
        }
        SourceResolver resolver(std::move(source_roots));

        std::vector<ProjectCoverage> projects;
        if (const auto packages = root.first_child("packages")) {
            for (const auto& package : packages->children("package")) {
                auto project = parse_package(package, report_path, options);
                attach_sources(project, resolver);
                // Source text lives on class lines; files are rebuilt to carry it.
                analysis::summarize_project(project);
                projects.push_back(std::move(project));
            }
        }

        log_.dbg("report parsed", redlog::field("path", report_path),
                 redlog::field("projects", projects.size()));
        return Result<std::vector<ProjectCoverage>, Error>::success(std::move(projects));
    }

    Result<std::vector<ProjectCoverage>, Error> parse_report_file(const fs::path& path,
                                                                 const ReportParseOptions& options) {
        auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<std::vector<ProjectCoverage>, Error>::failure(content.error());
        }
        return parse_report(content.value(), path.string(), options);
    }

}  // namespace cova::parsers
