#include "press/snapshot/SnapshotSet.hpp"
#include "press/errors.hpp"
#include "press/file_io.hpp"
#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>
#include <omp.h>
#include <spdlog/spdlog.h>

namespace press {

using json = nlohmann::json;

std::string backup_file_name(std::size_t index, const std::string& path) {
    fs::path p = fs::path(path).lexically_normal();
    if (p.is_absolute()) p = p.relative_path();

    std::string flat = p.generic_string();
    for (auto& c : flat) {
        if (c == '/' || c == '\\' || c == ':') c = '%';
    }
    char prefix[16];
    std::snprintf(prefix, sizeof(prefix), "%05zu_", index);
    return prefix + flat;
}

SnapshotSet::SnapshotSet(SnapshotLayout layout) : layout_(std::move(layout)) {}

bool SnapshotSet::has_record() const {
    std::error_code ec;
    return fs::is_regular_file(record_path(), ec);
}

SnapshotRecord SnapshotSet::load() const {
    std::ifstream f(record_path());
    if (!f) throw IoError("cannot open snapshot record " + record_path().string());

    SnapshotRecord record;
    try {
        json j = json::parse(f);
        record.new_files = j.value("new_files", std::vector<std::string>{});
        for (const auto& pair : j.value(layout_.entries_key, json::array())) {
            record.entries.push_back({pair.at(0).get<std::string>(), pair.at(1).get<std::string>()});
        }
    } catch (const json::exception& e) {
        throw IoError("corrupt snapshot record " + record_path().string() + ": " + e.what());
    }
    return record;
}

void SnapshotSet::save(const SnapshotRecord& record) const {
    json j = json::object();
    if (layout_.tracks_new_files) j["new_files"] = record.new_files;
    json pairs = json::array();
    for (const auto& e : record.entries) pairs.push_back({e.original_path, e.backup_path});
    j[layout_.entries_key] = pairs;

    write_file_bytes(record_path().string(), j.dump(2));
}

void SnapshotSet::discard() {
    std::error_code ec;
    fs::remove_all(layout_.root, ec);
    if (ec) throw IoError("cannot remove " + layout_.root.string() + ": " + ec.message());
}

SnapshotRecord SnapshotSet::capture(const std::vector<std::string>& paths, const std::vector<std::string>& new_files) {
    discard();
    std::error_code ec;
    fs::create_directories(layout_.root, ec);
    if (ec) throw IoError("cannot create backup area " + layout_.root.string() + ": " + ec.message());

    SnapshotRecord record;
    record.new_files = new_files;
    record.entries.resize(paths.size());
    std::vector<std::string> errors(paths.size());

    // Each slot touches a distinct source and backup file.
    #pragma omp parallel for
    for (int i = 0; i < (int)paths.size(); ++i) {
        const std::string& original = paths[i];
        record.entries[i].original_path = original;

        std::error_code local_ec;
        if (!fs::exists(original, local_ec)) {
            if (local_ec) errors[i] = "cannot stat " + original + ": " + local_ec.message();
            continue; // empty backup marker
        }
        fs::path backup = layout_.root / backup_file_name(i, original);
        fs::copy_file(original, backup, fs::copy_options::overwrite_existing, local_ec);
        if (local_ec) {
            errors[i] = "cannot back up " + original + ": " + local_ec.message();
            continue;
        }
        record.entries[i].backup_path = backup.string();
    }

    for (const auto& err : errors) {
        if (!err.empty()) throw IoError(err);
    }

    save(record);
    spdlog::info("Snapshot of {} files written to {} ({} threads)", paths.size(), layout_.root.string(), omp_get_max_threads());
    return record;
}

RestoreSummary SnapshotSet::restore() {
    SnapshotRecord record = load();
    RestoreSummary summary;
    std::error_code ec;

    for (const auto& path : record.new_files) {
        if (fs::exists(path, ec)) {
            if (!fs::remove(path, ec) || ec) throw IoError("cannot delete " + path + ": " + ec.message());
            spdlog::info("Deleted new file: {}", path);
            summary.deleted++;
        }
    }

    for (const auto& entry : record.entries) {
        if (entry.backup_path.empty()) {
            // Did not exist before the snapshot.
            if (fs::exists(entry.original_path, ec)) {
                if (!fs::remove(entry.original_path, ec) || ec) {
                    throw IoError("cannot delete " + entry.original_path + ": " + ec.message());
                }
                summary.deleted++;
            }
            continue;
        }
        if (!fs::exists(entry.backup_path, ec)) {
            spdlog::warn("Backup {} is missing; {} left as is", entry.backup_path, entry.original_path);
            continue;
        }
        copy_file_over(entry.backup_path, entry.original_path);
        spdlog::info("Restored: {}", entry.original_path);
        summary.restored++;
    }

    if (layout_.retention == Retention::ConsumeOnRestore) discard();
    return summary;
}

std::size_t SnapshotSet::prune_unchanged() {
    SnapshotRecord record = load();
    SnapshotRecord kept;
    std::size_t dropped = 0;
    std::error_code ec;

    for (const auto& path : record.new_files) {
        if (fs::exists(path, ec)) kept.new_files.push_back(path);
        else dropped++;
    }

    for (const auto& entry : record.entries) {
        bool exists_now = fs::exists(entry.original_path, ec);
        bool unchanged;
        if (entry.backup_path.empty()) {
            unchanged = !exists_now;
        } else {
            unchanged = exists_now && read_file_bytes(entry.original_path) == read_file_bytes(entry.backup_path);
        }

        if (unchanged) {
            if (!entry.backup_path.empty()) fs::remove(entry.backup_path, ec);
            dropped++;
        } else {
            kept.entries.push_back(entry);
        }
    }

    save(kept);
    return dropped;
}

} // namespace press
