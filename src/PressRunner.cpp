#include "press/PressRunner.hpp"
#include "press/api/PromptBuilder.hpp"
#include "press/errors.hpp"
#include "press/file_io.hpp"
#include "press/part_filter.hpp"
#include "press/path_resolver.hpp"
#include "press/snapshot/CheckpointManager.hpp"
#include "press/snapshot/RollbackManager.hpp"
#include "press/workspace_scanner.hpp"
#include <chrono>
#include <set>
#include <spdlog/spdlog.h>

namespace press {

PressRunner::PressRunner(Config config, std::shared_ptr<CompletionService> service)
    : config_(std::move(config)), service_(std::move(service)) {}

PartSelection PressRunner::normalize_selection(const PartSelection& selection,
                                               const std::vector<std::string>& known_paths) {
    PathResolver resolver(known_paths);
    PartSelection normalized;
    for (const auto& [path, ids] : selection) {
        auto resolved = resolver.resolve(path);
        if (!resolved) {
            spdlog::warn("Selection names unknown file {}", path);
            continue;
        }
        normalized[*resolved].insert(ids.begin(), ids.end());
    }
    return normalized;
}

std::string PressRunner::complete(const std::string& system_prompt, const std::string& user_prompt) {
    return with_retries([&]() { return service_->complete(system_prompt, user_prompt); },
                        config_.retries, config_.retry_delay_ms);
}

std::vector<ChunkedFile> PressRunner::select_parts(const std::vector<ChunkedFile>& chunks,
                                                   const std::vector<std::string>& files,
                                                   const std::string& prompt, std::string& preprocessor_prompt) {
    const auto format = config_.format();
    auto decoder = make_decoder(format);
    auto pre = build_preprocessor_prompt(config_.system_prompt, prompt, serialize_chunks(chunks, format), format);

    SelectionResult selection;
    try {
        selection = decoder->decode_selection(complete(pre.system, pre.user));
    } catch (const PatchFormatError& e) {
        spdlog::warn("Preprocessor reply unusable ({}), sending every part", e.what());
        return chunks;
    }

    auto filtered = filter_parts(chunks, normalize_selection(selection.selection, files));
    if (filtered.empty()) {
        spdlog::warn("Preprocessor selected no parts, sending every part");
        return chunks;
    }
    preprocessor_prompt = selection.preprocessor_prompt;
    return filtered;
}

// Loose files are the previous run's artifacts; subdirectories (.rollback,
// .checkpoint, code) are kept.
void PressRunner::prepare_output_dir(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw IoError("cannot create " + dir.string() + ": " + ec.message());

    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        std::error_code rm_ec;
        fs::remove(it->path(), rm_ec);
        if (rm_ec) throw IoError("cannot clear " + it->path().string() + ": " + rm_ec.message());
    }
    if (ec) throw IoError("cannot list " + dir.string() + ": " + ec.message());
}

RunOutcome PressRunner::run(const RunRequest& request) {
    auto start = std::chrono::high_resolution_clock::now();
    if (request.prompt.empty()) throw ConfigError("a prompt is required");
    config_.validate();

    RunOutcome outcome;
    const fs::path output_dir = config_.press_output_dir();
    outcome.output_dir = output_dir.string();

    auto files = collect_files(request.paths, request.ignore, output_dir);
    outcome.files_scanned = files.size();
    if (files.empty()) throw PressError("No files to process");

    auto chunks = chunk_files(files, config_.chunk_size);
    const auto format = config_.format();

    std::string preprocessor_prompt;
    auto payload = config_.use_preprocessor ? select_parts(chunks, files, request.prompt, preprocessor_prompt)
                                            : chunks;
    outcome.files_sent = payload.size();
    spdlog::info("Sending {} of {} files", payload.size(), chunks.size());

    auto prompt = build_code_editor_prompt(config_.system_prompt, request.prompt,
                                           serialize_chunks(payload, format), preprocessor_prompt, format);
    std::string raw = complete(prompt.system, prompt.user);

    // A malformed reply throws here, before anything is written.
    PatchResult patch = make_decoder(format)->decode_patch(raw);
    outcome.free_text = patch.free_text;

    prepare_output_dir(output_dir);
    write_file_bytes((output_dir / "raw_response.log").string(), raw);

    ApplyOptions options;
    options.chunk_size = config_.chunk_size;
    options.auto_mode = request.auto_mode;
    options.output_dir = output_dir.string();
    PatchApplier applier(options, files);
    WritePlan plan = applier.plan(patch);

    std::vector<std::string> modified;
    std::vector<std::string> created;
    std::set<std::string> seen;
    for (const auto& u : plan.updates) {
        if (seen.insert(u.target_path).second) modified.push_back(u.target_path);
    }
    for (const auto& c : plan.creations) {
        if (!seen.insert(c.target_path).second) continue;
        std::error_code ec;
        if (fs::exists(c.target_path, ec)) modified.push_back(c.target_path);
        else created.push_back(c.target_path);
    }

    RollbackManager rollback(output_dir);
    if (!modified.empty() || !created.empty()) {
        rollback.save(created, modified);
        outcome.rollback_saved = true;
    } else {
        spdlog::warn("Response contains no file changes; previous rollback point kept");
    }

    outcome.report = applier.apply(patch, plan);
    if (outcome.rollback_saved) rollback.finalize();

    auto end = std::chrono::high_resolution_clock::now();
    double duration = std::chrono::duration<double>(end - start).count();
    spdlog::info("Run finished in {:.2f}s: {} modified, {} created, {} failed", duration,
                 outcome.report.modified, outcome.report.created, outcome.report.failures.size());
    return outcome;
}

RestoreSummary PressRunner::rollback() {
    RollbackManager manager(config_.press_output_dir());
    return manager.rollback();
}

std::size_t PressRunner::checkpoint(const std::vector<std::string>& paths) {
    if (paths.empty()) throw ConfigError("checkpoint needs at least one path");
    CheckpointManager manager(config_.press_output_dir());
    return manager.checkpoint(paths);
}

RestoreSummary PressRunner::revert() {
    CheckpointManager manager(config_.press_output_dir());
    return manager.revert();
}

} // namespace press
