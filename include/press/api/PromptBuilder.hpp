#pragma once
#include <string>
#include <vector>
#include "press/chunker.hpp"
#include "press/patch/PatchDecoder.hpp"

namespace press {

struct Prompt {
    std::string system;
    std::string user;
};

// Serializes chunk sets for the model. Tag form:
//   <file path="src/a.rs" parts="3"><part id="1"><![CDATA[...]]></part>...</file>
// JSON form: {"files":[{"file_path":..,"parts":[{"part_id":1,"content":..}]}]}
std::string serialize_chunks(const std::vector<ChunkedFile>& chunks, ResponseFormat format);

// "]]>" cannot appear inside a CDATA section; split it across two sections.
std::string escape_cdata(const std::string& content);

std::string escape_attribute(const std::string& value);

// First pass: asks which parts need editing.
Prompt build_preprocessor_prompt(const std::string& user_system_prompt, const std::string& user_prompt,
                                 const std::string& code_files, ResponseFormat format);

// Second pass: asks for the edited parts. preprocessor_prompt may be empty.
Prompt build_code_editor_prompt(const std::string& user_system_prompt, const std::string& user_prompt,
                                const std::string& code_files, const std::string& preprocessor_prompt,
                                ResponseFormat format);

} // namespace press
