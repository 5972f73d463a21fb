#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace press {

// Maps a path named in a model response onto one of the known original paths.
class PathResolver {
public:
    explicit PathResolver(std::vector<std::string> known_paths);

    // Exact match first. Falls back to the first known path whose string ends
    // with the response path; with several candidates the earliest one in
    // input order wins and a warning is logged.
    std::optional<std::string> resolve(const std::string& response_path) const;

    const std::vector<std::string>& known_paths() const { return known_paths_; }

private:
    std::vector<std::string> known_paths_;
    std::vector<std::string> normalized_;
};

// Separator-agnostic form used for comparisons: '\' -> '/', leading "./" removed.
std::string normalize_path_string(std::string path);

// Segment-wise check that child equals parent or lies below it.
bool is_inside_path(const std::filesystem::path& child, const std::filesystem::path& parent);

} // namespace press
