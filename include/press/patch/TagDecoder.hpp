#pragma once
#include "press/patch/PatchDecoder.hpp"

namespace press {

// Decoder for the tag wire format:
//   <file path='a.rs'><part id="2"><![CDATA[...]]></part></file>
//   <new_file path='b.rs'><![CDATA[...]]></new_file>
//   <response>free text</response>
// and for the preprocessor reply:
//   <parts_to_edit><file path='a.rs'>1,3</file></parts_to_edit>
//   <preprocessor_prompt>...</preprocessor_prompt>
class TagDecoder : public PatchDecoder {
public:
    PatchResult decode_patch(const std::string& response) const override;
    SelectionResult decode_selection(const std::string& response) const override;
};

} // namespace press
