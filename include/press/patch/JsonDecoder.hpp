#pragma once
#include "press/patch/PatchDecoder.hpp"

namespace press {

// Decoder for the structured wire format. The document may be wrapped in a
// ```json fence or surrounded by prose; the outermost object is used.
class JsonDecoder : public PatchDecoder {
public:
    PatchResult decode_patch(const std::string& response) const override;
    SelectionResult decode_selection(const std::string& response) const override;
};

} // namespace press
