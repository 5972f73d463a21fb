#pragma once
#include <string>
#include <vector>
#include "press/snapshot/SnapshotSet.hpp"

namespace press {

// User-invoked snapshot that survives across runs. Lives in <output>/.checkpoint.
class CheckpointManager {
public:
    explicit CheckpointManager(const fs::path& output_dir);

    // Replaces any previous checkpoint with a copy of every file under `paths`
    // (directories are expanded recursively). Returns the number of files saved.
    std::size_t checkpoint(const std::vector<std::string>& paths);

    // Copies every checkpointed file back. The checkpoint stays, so revert can
    // be repeated. Throws NoCheckpointToRevert when none exists.
    RestoreSummary revert();

    bool has_checkpoint() const { return snapshots_.has_record(); }

    // Files `paths` expands to, skipping anything inside the output directory.
    std::vector<std::string> expand(const std::vector<std::string>& paths) const;

private:
    fs::path output_dir_;
    SnapshotSet snapshots_;
};

} // namespace press
