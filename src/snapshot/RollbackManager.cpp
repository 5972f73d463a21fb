#include "press/snapshot/RollbackManager.hpp"
#include "press/errors.hpp"
#include <spdlog/spdlog.h>

namespace press {

RollbackManager::RollbackManager(const fs::path& output_dir)
    : snapshots_({output_dir / ".rollback", "rollback.json", "rollback_files", true, Retention::ConsumeOnRestore}) {}

void RollbackManager::save(const std::vector<std::string>& new_files, const std::vector<std::string>& modified_files) {
    snapshots_.capture(modified_files, new_files);
    spdlog::info("Rollback point saved: {} files backed up, {} new files tracked", modified_files.size(), new_files.size());
}

std::size_t RollbackManager::finalize() {
    std::size_t dropped = snapshots_.prune_unchanged();
    spdlog::debug("Rollback record pruned {} unchanged entries", dropped);
    return dropped;
}

RestoreSummary RollbackManager::rollback() {
    if (!snapshots_.has_record()) throw NoChangesToRollback();
    auto summary = snapshots_.restore();
    spdlog::info("Rollback complete: {} restored, {} deleted", summary.restored, summary.deleted);
    return summary;
}

} // namespace press
