#include "press/workspace_scanner.hpp"
#include "press/path_resolver.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <spdlog/spdlog.h>

namespace press {

namespace fs = std::filesystem;

const std::vector<std::string>& text_extensions() {
    static const std::vector<std::string> exts = {
        "txt", "rs", "ts", "js", "go", "json", "py", "cpp", "c", "h", "hpp", "css", "html", "md",
        "yaml", "yml", "toml", "xml", "tsx"
    };
    return exts;
}

namespace {

struct ScanFilter {
    const std::vector<std::string>& ignore_paths;
    fs::path output_abs;  // empty when there is no output directory to skip

    bool ignored(const fs::path& path) const {
        for (const auto& ign : ignore_paths) {
            if (is_inside_path(path, fs::path(ign))) return true;
        }
        return !output_abs.empty() && is_inside_path(fs::absolute(path).lexically_normal(), output_abs);
    }
};

} // namespace

static bool has_text_extension(const fs::path& path) {
    std::string ext = path.extension().string();
    if (!ext.empty() && ext[0] == '.') ext = ext.substr(1);
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    const auto& exts = text_extensions();
    return std::find(exts.begin(), exts.end(), ext) != exts.end();
}

static void scan_directory_recursive(const fs::path& dir, const ScanFilter& filter,
                                     std::vector<std::string>& results) {
    std::error_code ec;
    std::vector<fs::path> entries;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        entries.push_back(it->path());
    }
    if (ec) {
        spdlog::error("Scanner error at {}: {}", dir.string(), ec.message());
        return;
    }
    std::sort(entries.begin(), entries.end());

    for (const auto& path : entries) {
        if (filter.ignored(path)) {
            spdlog::debug("SKIP | {} | ignored", path.string());
            continue;
        }
        if (fs::is_directory(path, ec)) {
            scan_directory_recursive(path, filter, results);
        } else if (fs::is_regular_file(path, ec) && has_text_extension(path)) {
            spdlog::debug("FILE | {} | COLLECT", path.string());
            results.push_back(path.string());
        }
    }
}

std::vector<std::string> collect_files(const std::vector<std::string>& paths,
                                       const std::vector<std::string>& ignore_paths,
                                       const fs::path& output_dir) {
    ScanFilter filter{ignore_paths, {}};
    if (!output_dir.empty()) filter.output_abs = fs::absolute(output_dir).lexically_normal();

    std::vector<std::string> files;
    for (const auto& raw : paths) {
        fs::path p(raw);
        std::error_code ec;
        if (fs::is_regular_file(p, ec)) {
            if (!filter.ignored(p)) files.push_back(p.string());
        } else if (fs::is_directory(p, ec)) {
            scan_directory_recursive(p, filter, files);
        } else {
            spdlog::error("Path not found: {}", raw);
        }
    }

    spdlog::info("Scanning {} paths | Ignore: {} | Found: {}", paths.size(), ignore_paths.size(), files.size());
    return files;
}

} // namespace press
