#pragma once
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace press {

namespace fs = std::filesystem;

enum class Retention {
    ConsumeOnRestore,  // restore deletes the backup area and its record
    ReplaceOnCapture   // restore keeps everything; only the next capture replaces it
};

struct SnapshotLayout {
    fs::path root;                 // backup area, owned exclusively by the snapshot set
    std::string record_file;       // record file name inside root
    std::string entries_key;       // JSON key holding the (original, backup) pairs
    bool tracks_new_files = false; // record also lists files the run created
    Retention retention = Retention::ReplaceOnCapture;
};

struct SnapshotEntry {
    std::string original_path;
    std::string backup_path; // empty: the original did not exist at capture time
};

struct SnapshotRecord {
    std::vector<std::string> new_files;
    std::vector<SnapshotEntry> entries;
};

struct RestoreSummary {
    std::size_t restored = 0;
    std::size_t deleted = 0;
};

// Copies a set of files aside and puts them back later. Rollback and
// checkpoint are two layouts of this class.
class SnapshotSet {
public:
    explicit SnapshotSet(SnapshotLayout layout);

    bool has_record() const;
    fs::path record_path() const { return layout_.root / layout_.record_file; }
    const SnapshotLayout& layout() const { return layout_; }

    // Deletes any previous backup area, copies every path in `paths` into a
    // fresh one and writes the record. Paths that do not exist yet are recorded
    // with an empty backup. Throws IoError; the record is only written once
    // every copy succeeded.
    SnapshotRecord capture(const std::vector<std::string>& paths, const std::vector<std::string>& new_files = {});

    SnapshotRecord load() const;
    void save(const SnapshotRecord& record) const;

    // Deletes recorded new files, copies backups over their originals and
    // removes originals whose backup is empty. Applies the retention policy.
    RestoreSummary restore();

    // Drops entries whose original still matches its backup and new files
    // that were never written. Returns the number of entries dropped.
    std::size_t prune_unchanged();

    // Removes the backup area and record.
    void discard();

private:
    SnapshotLayout layout_;
};

// Flat, collision-free backup file name for the index-th captured path.
std::string backup_file_name(std::size_t index, const std::string& path);

} // namespace press
