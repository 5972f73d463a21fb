#include "press/path_resolver.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace press {

std::string normalize_path_string(std::string path) {
    std::replace(path.begin(), path.end(), '\\', '/');
    while (path.rfind("./", 0) == 0) path.erase(0, 2);
    return path;
}

bool is_inside_path(const std::filesystem::path& child, const std::filesystem::path& parent) {
    if (parent.empty()) return false;
    auto c = child.lexically_normal();
    auto p = parent.lexically_normal();
    auto it_c = c.begin();
    for (auto it_p = p.begin(); it_p != p.end(); ++it_p) {
        // A trailing separator leaves an empty last segment
        if (it_p->empty() || *it_p == ".") continue;
        if (it_c == c.end() || *it_c != *it_p) return false;
        ++it_c;
    }
    return true;
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

PathResolver::PathResolver(std::vector<std::string> known_paths) : known_paths_(std::move(known_paths)) {
    normalized_.reserve(known_paths_.size());
    for (const auto& p : known_paths_) normalized_.push_back(normalize_path_string(p));
}

std::optional<std::string> PathResolver::resolve(const std::string& response_path) const {
    std::string wanted = normalize_path_string(response_path);
    if (wanted.empty()) return std::nullopt;

    for (std::size_t i = 0; i < normalized_.size(); ++i) {
        if (normalized_[i] == wanted) return known_paths_[i];
    }

    // Fallback: the response may have dropped a directory prefix.
    std::optional<std::size_t> first;
    std::size_t matches = 0;
    for (std::size_t i = 0; i < normalized_.size(); ++i) {
        if (ends_with(normalized_[i], wanted)) {
            if (!first) first = i;
            matches++;
        }
    }
    if (!first) return std::nullopt;
    if (matches > 1) {
        spdlog::warn("Ambiguous response path '{}' matches {} files, using {}", response_path, matches, known_paths_[*first]);
    }
    return known_paths_[*first];
}

} // namespace press
