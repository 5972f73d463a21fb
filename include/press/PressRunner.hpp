#pragma once
#include <memory>
#include <string>
#include <vector>
#include "press/api/CompletionService.hpp"
#include "press/chunker.hpp"
#include "press/config.hpp"
#include "press/patch/PatchApplier.hpp"
#include "press/snapshot/SnapshotSet.hpp"

namespace press {

struct RunRequest {
    std::vector<std::string> paths;
    std::vector<std::string> ignore;
    std::string prompt;
    bool auto_mode = false;
};

struct RunOutcome {
    std::size_t files_scanned = 0;
    std::size_t files_sent = 0;
    ApplyReport report;
    bool rollback_saved = false;
    std::string output_dir;
    std::string free_text;
};

// One patch pass plus the rollback/checkpoint commands, all rooted at
// config.press_output_dir().
class PressRunner {
public:
    PressRunner(Config config, std::shared_ptr<CompletionService> service);

    // scan -> chunk -> (select) -> complete -> decode -> snapshot -> apply.
    // Anything that fails before the snapshot leaves the disk untouched.
    RunOutcome run(const RunRequest& request);

    RestoreSummary rollback();
    std::size_t checkpoint(const std::vector<std::string>& paths);
    RestoreSummary revert();

    // Rewrites selection keys onto known paths (exact, then suffix). Keys
    // that match nothing are dropped with a warning.
    static PartSelection normalize_selection(const PartSelection& selection,
                                             const std::vector<std::string>& known_paths);

private:
    Config config_;
    std::shared_ptr<CompletionService> service_;

    std::vector<ChunkedFile> select_parts(const std::vector<ChunkedFile>& chunks,
                                          const std::vector<std::string>& files,
                                          const std::string& prompt, std::string& preprocessor_prompt);
    std::string complete(const std::string& system_prompt, const std::string& user_prompt);
    void prepare_output_dir(const fs::path& dir);
};

} // namespace press
