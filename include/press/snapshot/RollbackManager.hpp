#pragma once
#include <string>
#include <vector>
#include "press/snapshot/SnapshotSet.hpp"

namespace press {

// One-shot undo of the last mutating run. Lives in <output>/.rollback.
class RollbackManager {
public:
    explicit RollbackManager(const fs::path& output_dir);

    // Must complete before the first write of the run. Backs up every path in
    // modified_files and records new_files for deletion. Replaces any earlier record.
    void save(const std::vector<std::string>& new_files, const std::vector<std::string>& modified_files);

    // After the run: forget entries the run did not actually change.
    std::size_t finalize();

    // Undoes the recorded run and deletes the record. Throws NoChangesToRollback
    // without touching the filesystem when there is no record.
    RestoreSummary rollback();

    bool has_pending() const { return snapshots_.has_record(); }

private:
    SnapshotSet snapshots_;
};

} // namespace press
