#include "press/patch/PatchApplier.hpp"
#include "press/chunker.hpp"
#include "press/errors.hpp"
#include "press/file_io.hpp"
#include <algorithm>
#include <filesystem>
#include <spdlog/spdlog.h>

namespace press {

namespace fs = std::filesystem;

std::string merge_parts(const std::string& path, const std::string& current_content,
                        std::size_t chunk_size, const std::vector<Part>& replacements) {
    ChunkedFile current = chunk_content(path, current_content, chunk_size);
    const std::size_t count = current.parts.size();

    std::size_t ignored = 0;
    for (const auto& part : replacements) {
        if (part.part_id == 0 || part.part_id > count) {
            ignored++;
            continue;
        }
        current.parts[part.part_id - 1].content = part.content;
    }
    if (ignored > 0) {
        spdlog::warn("Ignored {} out-of-range part ids for {} ({} parts on disk)", ignored, path, count);
    }
    return reconstruct(current);
}

std::string staging_relative_path(const std::string& path) {
    fs::path p = fs::path(path).lexically_normal();
    if (p.is_absolute()) p = p.relative_path();

    fs::path rel;
    for (const auto& segment : p) {
        if (segment == ".." || segment == ".") continue;
        rel /= segment;
    }
    return rel.string();
}

PatchApplier::PatchApplier(ApplyOptions options, std::vector<std::string> original_paths)
    : options_(std::move(options)), resolver_(std::move(original_paths)) {}

std::string PatchApplier::target_for(const std::string& original_path) const {
    if (options_.auto_mode) return original_path;
    return (fs::path(options_.output_dir) / "code" / staging_relative_path(original_path)).string();
}

WritePlan PatchApplier::plan(const PatchResult& patch) const {
    WritePlan plan;

    for (std::size_t i = 0; i < patch.updated.size(); ++i) {
        const auto& file = patch.updated[i];
        auto resolved = resolver_.resolve(file.file_path);
        if (!resolved) {
            UnresolvedPath err(file.file_path);
            spdlog::error("{}", err.what());
            plan.unresolved.push_back({file.file_path, err.what()});
            continue;
        }
        auto same = std::find_if(plan.updates.begin(), plan.updates.end(),
                                 [&](const PlannedUpdate& u) { return u.original_path == *resolved; });
        if (same != plan.updates.end()) {
            spdlog::debug("Merging repeated entry '{}' into {}", file.file_path, *resolved);
            same->indices.push_back(i);
            continue;
        }
        plan.updates.push_back({{i}, *resolved, target_for(*resolved)});
    }

    for (std::size_t i = 0; i < patch.created.size(); ++i) {
        plan.creations.push_back({i, patch.created[i].file_path});
    }

    if (!patch.free_text.empty()) {
        plan.free_text_path = (fs::path(options_.output_dir) / "response.txt").string();
    }
    return plan;
}

ApplyReport PatchApplier::apply(const PatchResult& patch, const WritePlan& plan) const {
    ApplyReport report;
    report.failures = plan.unresolved;

    std::error_code ec;
    fs::create_directories(options_.output_dir, ec);
    if (ec) throw IoError("cannot create output directory " + options_.output_dir + ": " + ec.message());

    for (const auto& update : plan.updates) {
        const auto& file = patch.updated[update.indices.front()];
        std::vector<Part> parts;
        for (std::size_t index : update.indices) {
            const auto& more = patch.updated[index].parts;
            parts.insert(parts.end(), more.begin(), more.end());
        }
        try {
            std::string merged = merge_parts(update.original_path, read_file_bytes(update.original_path),
                                             options_.chunk_size, parts);
            write_file_bytes(update.target_path, merged);
            report.modified++;
            spdlog::info("Patched {} -> {}", update.original_path, update.target_path);
        } catch (const PressError& e) {
            spdlog::error("Skipping {}: {}", file.file_path, e.what());
            report.failures.push_back({file.file_path, e.what()});
        }
    }

    for (const auto& creation : plan.creations) {
        try {
            write_file_bytes(creation.target_path, patch.created[creation.index].content);
            report.created++;
            spdlog::info("Created {}", creation.target_path);
        } catch (const PressError& e) {
            spdlog::error("Skipping new file {}: {}", creation.target_path, e.what());
            report.failures.push_back({creation.target_path, e.what()});
        }
    }

    if (!plan.free_text_path.empty()) {
        try {
            write_file_bytes(plan.free_text_path, patch.free_text);
        } catch (const PressError& e) {
            report.failures.push_back({plan.free_text_path, e.what()});
        }
    }
    return report;
}

} // namespace press
