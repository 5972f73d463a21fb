#include "press/chunker.hpp"
#include "press/errors.hpp"
#include "press/file_io.hpp"
#include <algorithm>
#include <filesystem>
#include <spdlog/spdlog.h>

namespace press {

namespace fs = std::filesystem;

ChunkedFile chunk_content(const std::string& path, const std::string& content, std::size_t chunk_size) {
    ChunkedFile out;
    out.file_path = path;

    if (chunk_size == 0) {
        out.parts.push_back({1, content});
        return out;
    }
    if (content.empty()) return out;

    // A single terminal newline is a line terminator, not an extra empty line.
    std::size_t body_len = content.size();
    if (content.back() == '\n') {
        out.trailing_newline = true;
        body_len--;
    }

    // Line start offsets within the body
    std::vector<std::size_t> line_offsets;
    line_offsets.push_back(0);
    for (std::size_t i = 0; i < body_len; ++i) {
        if (content[i] == '\n') line_offsets.push_back(i + 1);
    }
    const std::size_t n_lines = line_offsets.size();

    for (std::size_t first = 0; first < n_lines; first += chunk_size) {
        std::size_t last = std::min(n_lines, first + chunk_size); // exclusive
        std::size_t b0 = line_offsets[first];
        std::size_t b1 = (last < n_lines) ? line_offsets[last] - 1 : body_len; // drop the joining '\n'
        out.parts.push_back({out.parts.size() + 1, content.substr(b0, b1 - b0)});
    }
    return out;
}

ChunkedFile chunk_file(const std::string& path, std::size_t chunk_size) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) throw IoError("cannot stat " + path + ": " + ec.message());
    if (size > MAX_FILE_SIZE) throw FileTooLarge(path, size, MAX_FILE_SIZE);

    auto chunked = chunk_content(path, read_file_bytes(path), chunk_size);
    spdlog::debug("Chunked {} into {} parts", path, chunked.parts.size());
    return chunked;
}

std::vector<ChunkedFile> chunk_files(const std::vector<std::string>& paths, std::size_t chunk_size) {
    std::vector<ChunkedFile> all;
    all.reserve(paths.size());
    for (const auto& p : paths) all.push_back(chunk_file(p, chunk_size));
    return all;
}

std::string reconstruct(const ChunkedFile& file) {
    std::string out;
    for (std::size_t i = 0; i < file.parts.size(); ++i) {
        if (i > 0) out += '\n';
        out += file.parts[i].content;
    }
    if (file.trailing_newline) out += '\n';
    return out;
}

} // namespace press
