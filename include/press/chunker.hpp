#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace press {

// Files above this size are refused at chunk time.
constexpr unsigned long long MAX_FILE_SIZE = 10ull * 1024 * 1024;

struct Part {
    std::size_t part_id;   // 1-based
    std::string content;   // one or more lines, joined by '\n'
};

struct ChunkedFile {
    std::string file_path;
    std::vector<Part> parts;
    bool trailing_newline = false; // content ended with a single terminal '\n'
};

// Splits content on '\n' into groups of chunk_size lines. chunk_size == 0 puts
// the whole content into part 1. Deterministic for a given (content, chunk_size).
ChunkedFile chunk_content(const std::string& path, const std::string& content, std::size_t chunk_size);

// Reads path from disk and chunks it. Throws FileTooLarge or IoError.
ChunkedFile chunk_file(const std::string& path, std::size_t chunk_size);

// Chunks every path in order; the first failure propagates.
std::vector<ChunkedFile> chunk_files(const std::vector<std::string>& paths, std::size_t chunk_size);

// Inverse of chunk_content.
std::string reconstruct(const ChunkedFile& file);

} // namespace press
