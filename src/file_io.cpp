#include "press/file_io.hpp"
#include "press/errors.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace press {

namespace fs = std::filesystem;

std::string read_file_bytes(const std::string& path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) throw IoError("cannot open " + path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) throw IoError("read failed for " + path);
    return buffer.str();
}

void write_file_bytes(const std::string& path, const std::string& content) {
    fs::path target(path);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) throw IoError("cannot create directory " + target.parent_path().string() + ": " + ec.message());
    }
    std::ofstream out(target, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) throw IoError("cannot open " + path + " for writing");
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) throw IoError("write failed for " + path);
}

void copy_file_over(const std::string& from, const std::string& to) {
    fs::path target(to);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) throw IoError("cannot create directory " + target.parent_path().string() + ": " + ec.message());
    }
    fs::copy_file(from, target, fs::copy_options::overwrite_existing, ec);
    if (ec) throw IoError("cannot copy " + from + " to " + to + ": " + ec.message());
}

} // namespace press
