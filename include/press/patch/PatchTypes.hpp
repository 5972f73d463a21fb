#pragma once
#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>
#include "press/chunker.hpp"

namespace press {

// file path -> requested part ids
using PartSelection = std::map<std::string, std::set<std::size_t>>;

// Parts the model chose to rewrite. Ids refer to the original chunking; 0 marks an id that failed to parse.
struct UpdatedFile {
    std::string file_path;
    std::vector<Part> parts;
};

struct NewFile {
    std::string file_path;
    std::string content;
};

// Shared output of both response decoders.
struct PatchResult {
    std::vector<UpdatedFile> updated;
    std::vector<NewFile> created;
    std::string free_text;
};

// Output of the preprocessor pass.
struct SelectionResult {
    PartSelection selection;
    std::string preprocessor_prompt;
};

} // namespace press
