#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "press/patch/PatchTypes.hpp"
#include "press/path_resolver.hpp"

namespace press {

struct ApplyOptions {
    std::size_t chunk_size = 50;  // must match the chunk size the model saw
    bool auto_mode = false;       // overwrite originals instead of staging under <output>/code
    std::string output_dir;       // press.output directory of this run
};

struct FileFailure {
    std::string path;
    std::string message;
};

// One write per resolved original. Entries of PatchResult::updated that name
// the same file are merged in response order.
struct PlannedUpdate {
    std::vector<std::size_t> indices;  // into PatchResult::updated
    std::string original_path;  // resolved on-disk original
    std::string target_path;    // where the merged content goes
};

struct PlannedCreate {
    std::size_t index;          // into PatchResult::created
    std::string target_path;
};

// Every write a patch will perform, computed before anything touches disk.
struct WritePlan {
    std::vector<PlannedUpdate> updates;
    std::vector<PlannedCreate> creations;
    std::vector<FileFailure> unresolved;
    std::string free_text_path;  // empty when the patch has no free text
};

struct ApplyReport {
    std::size_t modified = 0;
    std::size_t created = 0;
    std::vector<FileFailure> failures;
};

// Re-chunks current_content with chunk_size and overwrites the slots named by
// replacements. Ids of 0 or beyond the part count are ignored.
std::string merge_parts(const std::string& path, const std::string& current_content,
                        std::size_t chunk_size, const std::vector<Part>& replacements);

// Relative path used for a file inside the staging tree.
std::string staging_relative_path(const std::string& path);

class PatchApplier {
public:
    PatchApplier(ApplyOptions options, std::vector<std::string> original_paths);

    WritePlan plan(const PatchResult& patch) const;

    // Writes the plan. Per-file failures land in the report; only a missing
    // output directory that cannot be created throws (IoError).
    ApplyReport apply(const PatchResult& patch, const WritePlan& plan) const;
    ApplyReport apply(const PatchResult& patch) const { return apply(patch, plan(patch)); }

    const ApplyOptions& options() const { return options_; }

private:
    ApplyOptions options_;
    PathResolver resolver_;

    std::string target_for(const std::string& original_path) const;
};

} // namespace press
