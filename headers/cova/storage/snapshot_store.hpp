//
// Created by gregorian-rayne on 1/14/26.
//

#ifndef COVA_SNAPSHOT_STORE_HPP
#define COVA_SNAPSHOT_STORE_HPP

/**
 * @file snapshot_store.hpp
 * @brief File-based storage of coverage snapshots.
 *
 * Provides:
 * - Saving analysis results as named snapshots
 * - Loading a snapshot back as a comparison baseline
 * - Marking one snapshot as the default baseline
 *
 * Storage location: .cova/snapshots/ (workspace-local)
 * Format: one JSON file per snapshot, metadata plus the full result
 */

#include "cova/types.hpp"
#include "cova/result.hpp"
#include "cova/error.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cova::storage {

    struct SnapshotMetadata {
        std::string name;
        std::string description;
        Timestamp created_at;
        std::vector<std::string> tags;
        std::size_t project_count = 0;
        double lines_covered_percentage = 0.0;
        double branches_covered_percentage = 0.0;
    };

    struct Snapshot {
        SnapshotMetadata metadata;
        CoverageAnalysisResult analysis;
    };

    class SnapshotStore {
    public:
        explicit SnapshotStore(const fs::path& root = ".cova/snapshots");

        /**
         * Saves a snapshot, replacing one with the same name.
         *
         * Names may contain letters, digits, '.', '-' and '_'.
         */
        Result<void, Error> save(
            const std::string& name,
            const CoverageAnalysisResult& analysis,
            const std::string& description = "",
            const std::vector<std::string>& tags = {}
        ) const;

        Result<Snapshot, Error> load(const std::string& name) const;

        /**
         * Lists snapshots, newest first. Unreadable files are skipped.
         */
        Result<std::vector<SnapshotMetadata>, Error> list() const;

        /**
         * Deletes a snapshot. Clears the baseline if it pointed here.
         */
        Result<void, Error> remove(const std::string& name) const;

        bool exists(const std::string& name) const;

        fs::path snapshot_path(const std::string& name) const;

        Result<void, Error> set_baseline(const std::string& name) const;

        std::optional<std::string> get_baseline() const;

        Result<void, Error> clear_baseline() const;

        const fs::path& root() const { return root_; }

    private:
        fs::path root_;
        fs::path baseline_file() const { return root_ / ".baseline"; }

        Result<void, Error> ensure_directory() const;
    };

    [[nodiscard]] bool is_valid_snapshot_name(const std::string& name);

}  // namespace cova::storage

#endif //COVA_SNAPSHOT_STORE_HPP
