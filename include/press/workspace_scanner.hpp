#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace press {

// Extensions (lowercase, no dot) collected when a directory is scanned.
const std::vector<std::string>& text_extensions();

// Expands user paths into the list of files to send. Explicit file paths are
// kept whatever their extension; directories are walked recursively and only
// text files are collected. Anything inside an ignore path is skipped.
// Missing paths are logged and skipped. Nothing under output_dir is collected,
// so staged copies and backups of earlier runs are never sent back.
std::vector<std::string> collect_files(const std::vector<std::string>& paths,
                                       const std::vector<std::string>& ignore_paths,
                                       const std::filesystem::path& output_dir = {});

} // namespace press
