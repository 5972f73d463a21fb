#include "press/snapshot/CheckpointManager.hpp"
#include "press/errors.hpp"
#include "press/path_resolver.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace press {

CheckpointManager::CheckpointManager(const fs::path& output_dir)
    : output_dir_(output_dir),
      snapshots_({output_dir / ".checkpoint", "checkpoint.json", "checkpoint_files", false, Retention::ReplaceOnCapture}) {}

std::vector<std::string> CheckpointManager::expand(const std::vector<std::string>& paths) const {
    const fs::path output_abs = fs::absolute(output_dir_).lexically_normal();
    std::vector<std::string> files;

    auto collect = [&](const fs::path& p) {
        if (is_inside_path(fs::absolute(p).lexically_normal(), output_abs)) return;
        files.push_back(p.string());
    };

    for (const auto& raw : paths) {
        fs::path root(raw);
        std::error_code ec;
        if (fs::is_regular_file(root, ec)) {
            collect(root);
        } else if (fs::is_directory(root, ec)) {
            std::vector<std::string> found;
            auto options = fs::directory_options::skip_permission_denied;
            for (fs::recursive_directory_iterator it(root, options, ec), end; !ec && it != end; it.increment(ec)) {
                if (it->is_regular_file(ec)) found.push_back(it->path().string());
            }
            if (ec) throw IoError("cannot scan " + raw + ": " + ec.message());
            std::sort(found.begin(), found.end());
            for (const auto& f : found) collect(f);
        } else {
            throw IoError("path not found: " + raw);
        }
    }

    std::sort(files.begin(), files.end());
    files.erase(std::unique(files.begin(), files.end()), files.end());
    return files;
}

std::size_t CheckpointManager::checkpoint(const std::vector<std::string>& paths) {
    auto files = expand(paths);
    if (files.empty()) spdlog::warn("Checkpoint paths contain no files");

    if (snapshots_.has_record()) spdlog::info("Replacing previous checkpoint");
    snapshots_.capture(files);
    spdlog::info("Checkpoint created with {} files", files.size());
    return files.size();
}

RestoreSummary CheckpointManager::revert() {
    if (!snapshots_.has_record()) throw NoCheckpointToRevert();
    auto summary = snapshots_.restore();
    spdlog::info("Reverted {} files to checkpoint", summary.restored);
    return summary;
}

} // namespace press
