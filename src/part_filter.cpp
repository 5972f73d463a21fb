#include "press/part_filter.hpp"
#include <spdlog/spdlog.h>

namespace press {

std::vector<ChunkedFile> filter_parts(const std::vector<ChunkedFile>& chunks, const PartSelection& selection) {
    std::vector<ChunkedFile> narrowed;
    std::size_t kept_parts = 0;

    for (const auto& file : chunks) {
        auto it = selection.find(file.file_path);
        if (it == selection.end()) continue;

        ChunkedFile slim;
        slim.file_path = file.file_path;
        slim.trailing_newline = file.trailing_newline;
        for (const auto& part : file.parts) {
            if (it->second.count(part.part_id)) slim.parts.push_back(part);
        }
        if (slim.parts.empty()) continue;

        kept_parts += slim.parts.size();
        narrowed.push_back(std::move(slim));
    }

    spdlog::info("Part filter kept {} parts across {} of {} files", kept_parts, narrowed.size(), chunks.size());
    return narrowed;
}

} // namespace press
