#pragma once
#include <vector>
#include "press/chunker.hpp"
#include "press/patch/PatchTypes.hpp"

namespace press {

// Narrows a full chunk set to the selected parts. Files not keyed in the
// selection, or left with no parts, are dropped. Relative part order is kept.
// The result is a payload only: never reconstruct files from it.
std::vector<ChunkedFile> filter_parts(const std::vector<ChunkedFile>& chunks, const PartSelection& selection);

} // namespace press
