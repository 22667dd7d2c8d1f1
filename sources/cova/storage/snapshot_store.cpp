//
// Created by gregorian-rayne on 1/14/26.
//

#include "cova/storage/snapshot_store.hpp"
#include "cova/serialization.hpp"
#include "cova/utils/file_utils.hpp"
#include "cova/utils/string_utils.hpp"

#include <nlohmann/json.hpp>
#include <redlog.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>

namespace cova::storage {

    namespace {

        redlog::logger log_ = redlog::get_logger("cova.storage");

        constexpr int kFormatMajor = 1;
        constexpr const char* kFormatVersion = "1.0";

        SnapshotMetadata read_metadata(const nlohmann::json& j, const std::string& fallback_name) {
            SnapshotMetadata metadata;
            metadata.name = j.value("name", fallback_name);
            metadata.description = j.value("description", "");
            metadata.created_at = serialization::parse_timestamp(j.value("created_at", "")).value_or(Timestamp{});
            if (const auto tags = j.find("tags"); tags != j.end() && tags->is_array()) {
                for (const auto& tag : *tags) {
                    if (tag.is_string()) metadata.tags.push_back(tag.get<std::string>());
                }
            }
            metadata.project_count = j.value("project_count", std::size_t{0});
            metadata.lines_covered_percentage = j.value("lines_covered_percentage", 0.0);
            metadata.branches_covered_percentage = j.value("branches_covered_percentage", 0.0);
            return metadata;
        }

        /**
         * Reads one snapshot file. Files without a version predate
         * versioning and are read as 1.x.
         */
        Result<nlohmann::json, Error> read_document(const fs::path& path) {
            auto content = file_utils::read_file(path);
            if (content.is_err()) {
                return Result<nlohmann::json, Error>::failure(content.error());
            }

            auto j = nlohmann::json::parse(content.value(), nullptr, false);
            if (j.is_discarded() || !j.is_object()) {
                return Result<nlohmann::json, Error>::failure(
                    Error(ErrorCode::ParseError, "Failed to parse snapshot JSON", path.string()));
            }

            if (const auto version = j.find("version"); version != j.end()) {
                const auto text = version->is_string() ? version->get<std::string>() : std::string{};
                const auto dot = text.find('.');
                const auto major = string_utils::parse_int(text.substr(0, dot));
                if (!major || *major > kFormatMajor) {
                    return Result<nlohmann::json, Error>::failure(
                        Error(ErrorCode::ParseError, "Unsupported snapshot format version: " + text, path.string()));
                }
            }
            return Result<nlohmann::json, Error>::success(std::move(j));
        }

        // Write beside the target and rename so readers never see half a file.
        Result<void, Error> replace_file(const fs::path& path, const std::string& content) {
            fs::path staging = path;
            staging += ".tmp";
            if (auto written = file_utils::write_file(staging, content); written.is_err()) {
                return written;
            }
            std::error_code ec;
            fs::rename(staging, path, ec);
            if (ec) {
                fs::remove(staging, ec);
                return Result<void, Error>::failure(Error::io_error("Failed to replace file", path.string()));
            }
            return Result<void, Error>::success();
        }

        Error not_found(const std::string& name) {
            return Error(ErrorCode::NotFound, "Snapshot not found: " + name);
        }

    }  // namespace

    bool is_valid_snapshot_name(const std::string& name) {
        if (name.empty() || name.front() == '.') {
            return false;
        }
        return std::ranges::all_of(name, [](const unsigned char c) {
            return std::isalnum(c) || c == '.' || c == '-' || c == '_';
        });
    }

    SnapshotStore::SnapshotStore(const fs::path& root)
        : root_(root) {}

    Result<void, Error> SnapshotStore::ensure_directory() const {
        std::error_code ec;
        fs::create_directories(root_, ec);
        if (ec) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to create snapshot directory: " + ec.message(), root_.string()));
        }
        return Result<void, Error>::success();
    }

    Result<void, Error> SnapshotStore::save(
        const std::string& name,
        const CoverageAnalysisResult& analysis,
        const std::string& description,
        const std::vector<std::string>& tags
    ) const
    {
        if (!is_valid_snapshot_name(name)) {
            return Result<void, Error>::failure(Error::invalid_argument("Invalid snapshot name: '" + name + "'"));
        }
        if (auto dir = ensure_directory(); dir.is_err()) {
            return dir;
        }

        const nlohmann::json j = {
            {"version", kFormatVersion},
            {"name", name},
            {"description", description},
            {"created_at", serialization::format_timestamp(std::chrono::system_clock::now())},
            {"tags", tags},
            {"project_count", analysis.projects.size()},
            {"lines_covered_percentage", analysis.summary.lines_covered_percentage},
            {"branches_covered_percentage", analysis.summary.branches_covered_percentage},
            {"analysis", serialization::serialize(analysis)}
        };

        const fs::path path = snapshot_path(name);
        if (auto written = replace_file(path, j.dump(2) + "\n"); written.is_err()) {
            return written;
        }
        log_.inf("snapshot saved", redlog::field("name", name), redlog::field("path", path.string()));
        return Result<void, Error>::success();
    }

    Result<Snapshot, Error> SnapshotStore::load(const std::string& name) const {
        if (!is_valid_snapshot_name(name)) {
            return Result<Snapshot, Error>::failure(Error::invalid_argument("Invalid snapshot name: '" + name + "'"));
        }

        const fs::path path = snapshot_path(name);
        if (std::error_code ec; !fs::exists(path, ec)) {
            return Result<Snapshot, Error>::failure(not_found(name));
        }

        auto document = read_document(path);
        if (document.is_err()) {
            return Result<Snapshot, Error>::failure(document.error());
        }
        const auto& j = document.value();

        const auto data = j.find("analysis");
        if (data == j.end()) {
            return Result<Snapshot, Error>::failure(
                Error(ErrorCode::ParseError, "Snapshot has no analysis data: " + name));
        }
        auto analysis = serialization::deserialize_analysis(*data);
        if (analysis.is_err()) {
            return Result<Snapshot, Error>::failure(analysis.error().with_context(path.string()));
        }

        Snapshot snapshot;
        snapshot.metadata = read_metadata(j, name);
        snapshot.analysis = std::move(analysis).value();
        return Result<Snapshot, Error>::success(std::move(snapshot));
    }

    Result<std::vector<SnapshotMetadata>, Error> SnapshotStore::list() const {
        using R = Result<std::vector<SnapshotMetadata>, Error>;
        std::vector<SnapshotMetadata> snapshots;

        std::error_code ec;
        if (!fs::exists(root_, ec)) {
            return R::success(std::move(snapshots));
        }

        for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
            const auto& path = it->path();
            if (!it->is_regular_file(ec) || path.extension() != ".json") {
                continue;
            }
            auto document = read_document(path);
            if (document.is_err()) {
                log_.wrn("skipping unreadable snapshot", redlog::field("path", path.string()),
                         redlog::field("error", document.error().message()));
                continue;
            }
            snapshots.push_back(read_metadata(document.value(), path.stem().string()));
        }
        if (ec) {
            return R::failure(Error::io_error("Failed to list snapshots: " + ec.message(), root_.string()));
        }

        std::ranges::sort(snapshots, [](const SnapshotMetadata& a, const SnapshotMetadata& b) {
            return a.created_at != b.created_at ? a.created_at > b.created_at : a.name < b.name;
        });
        return R::success(std::move(snapshots));
    }

    Result<void, Error> SnapshotStore::remove(const std::string& name) const {
        if (!exists(name)) {
            return Result<void, Error>::failure(not_found(name));
        }

        std::error_code ec;
        fs::remove(snapshot_path(name), ec);
        if (ec) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to remove snapshot: " + ec.message(), snapshot_path(name).string()));
        }

        if (const auto baseline = get_baseline(); !baseline) {
            return clear_baseline();
        }
        return Result<void, Error>::success();
    }

    bool SnapshotStore::exists(const std::string& name) const {
        std::error_code ec;
        return is_valid_snapshot_name(name) && fs::is_regular_file(snapshot_path(name), ec);
    }

    fs::path SnapshotStore::snapshot_path(const std::string& name) const {
        return root_ / (name + ".json");
    }

    Result<void, Error> SnapshotStore::set_baseline(const std::string& name) const {
        if (!exists(name)) {
            return Result<void, Error>::failure(not_found(name));
        }
        return replace_file(baseline_file(), name + "\n");
    }

    std::optional<std::string> SnapshotStore::get_baseline() const {
        std::error_code ec;
        if (!fs::exists(baseline_file(), ec)) {
            return std::nullopt;
        }
        auto content = file_utils::read_file(baseline_file());
        if (content.is_err()) {
            log_.wrn("baseline marker unreadable", redlog::field("error", content.error().message()));
            return std::nullopt;
        }
        std::string name(string_utils::trim(content.value()));
        if (exists(name)) {
            return name;
        }
        return std::nullopt;
    }

    Result<void, Error> SnapshotStore::clear_baseline() const {
        std::error_code ec;
        fs::remove(baseline_file(), ec);
        if (ec) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to clear baseline: " + ec.message(), baseline_file().string()));
        }
        return Result<void, Error>::success();
    }

}  // namespace cova::storage
