#include "press/api/PromptBuilder.hpp"
#include <nlohmann/json.hpp>

namespace press {

using json = nlohmann::json;

namespace {

const char* PREPROCESSOR_SYSTEM_PROMPT = R"(
You prepare source code for another model that will edit it.

You receive a user prompt and a set of code files. Every file is split into numbered parts.
Decide which parts have to change to satisfy the user prompt and list only those parts.
Leave out every part that can stay as it is.
)";

const char* PREPROCESSOR_TAG_FORMAT = R"(Respond in this format only:
<parts_to_edit><file path="path/to/file">1,3,4</file></parts_to_edit>
<preprocessor_prompt>why these parts were kept and the others left out</preprocessor_prompt>)";

const char* PREPROCESSOR_JSON_FORMAT = R"(Respond with one JSON object only:
{"parts_to_edit": [{"file_path": "path/to/file", "parts": [1, 3, 4]}],
 "preprocessor_prompt": "why these parts were kept and the others left out"})";

const char* CODE_EDITOR_SYSTEM_PROMPT = R"(
You analyze, refactor and improve source code. Your reply is applied directly to the code base.

You receive a user prompt and a set of code files. Every file is split into numbered parts.
Return every part you change in full, even when only one line of it changed.
Keep the part ids of the input; never renumber parts.
Only make the changes the user prompt asks for. Keep the code syntactically valid.
Put any message that is not code into the response block, or it is lost.
)";

const char* CODE_EDITOR_TAG_FORMAT = R"(YOUR REPLY IS APPLIED TO THE CODE BASE AS IS. TEXT OUTSIDE THESE TAGS IS IGNORED.
Respond in this format only:
<file path="path/to/file.ext"><part id="2"><![CDATA[updated part content]]></part></file>
<new_file path="path/to/new_file.ext"><![CDATA[whole file content]]></new_file>
<response><![CDATA[message]]></response>)";

const char* CODE_EDITOR_JSON_FORMAT = R"(YOUR REPLY IS APPLIED TO THE CODE BASE AS IS.
Respond with one JSON object only:
{"updated_files": [{"file_path": "path/to/file.ext", "parts": [{"part_id": 2, "content": "updated part content"}]}],
 "new_files": [{"file_path": "path/to/new_file.ext", "content": "whole file content"}],
 "response": "message"})";

std::string wrap(const std::string& tag, const std::string& body) {
    return "<" + tag + ">" + body + "</" + tag + ">";
}

std::string system_prompt_for(const char* fixed, const std::string& user_system_prompt) {
    return wrap("system_prompt", fixed) + " " + wrap("user_system_prompt", user_system_prompt);
}

} // namespace

std::string escape_cdata(const std::string& content) {
    std::string out;
    out.reserve(content.size());
    std::size_t pos = 0;
    while (true) {
        auto hit = content.find("]]>", pos);
        if (hit == std::string::npos) break;
        out.append(content, pos, hit - pos);
        out += "]]]]><![CDATA[>";
        pos = hit + 3;
    }
    out.append(content, pos, std::string::npos);
    return out;
}

std::string escape_attribute(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out += c;
        }
    }
    return out;
}

std::string serialize_chunks(const std::vector<ChunkedFile>& chunks, ResponseFormat format) {
    if (format == ResponseFormat::Json) {
        json files = json::array();
        for (const auto& file : chunks) {
            json parts = json::array();
            for (const auto& part : file.parts) {
                parts.push_back({{"part_id", part.part_id}, {"content", part.content}});
            }
            files.push_back({{"file_path", file.file_path}, {"parts_total", file.parts.size()}, {"parts", parts}});
        }
        return json{{"files", files}}.dump(2);
    }

    std::string out;
    for (const auto& file : chunks) {
        out += "<file path=\"" + escape_attribute(file.file_path) + "\" parts=\"" +
               std::to_string(file.parts.size()) + "\">\n";
        for (const auto& part : file.parts) {
            out += "<part id=\"" + std::to_string(part.part_id) + "\"><![CDATA[" +
                   escape_cdata(part.content) + "]]></part>\n";
        }
        out += "</file>\n";
    }
    return out;
}

Prompt build_preprocessor_prompt(const std::string& user_system_prompt, const std::string& user_prompt,
                                 const std::string& code_files, ResponseFormat format) {
    const char* directive = format == ResponseFormat::Json ? PREPROCESSOR_JSON_FORMAT : PREPROCESSOR_TAG_FORMAT;
    Prompt p;
    p.system = system_prompt_for(PREPROCESSOR_SYSTEM_PROMPT, user_system_prompt);
    p.user = wrap("code_files", code_files) + " " + wrap("user_prompt", user_prompt) + " " +
             wrap("important", directive);
    return p;
}

Prompt build_code_editor_prompt(const std::string& user_system_prompt, const std::string& user_prompt,
                                const std::string& code_files, const std::string& preprocessor_prompt,
                                ResponseFormat format) {
    const char* directive = format == ResponseFormat::Json ? CODE_EDITOR_JSON_FORMAT : CODE_EDITOR_TAG_FORMAT;
    Prompt p;
    p.system = system_prompt_for(CODE_EDITOR_SYSTEM_PROMPT, user_system_prompt);
    p.user = wrap("code_files", code_files) + " " + wrap("user_prompt", user_prompt);
    if (!preprocessor_prompt.empty()) p.user += " " + wrap("preprocessor_prompt", preprocessor_prompt);
    p.user += " " + wrap("important", directive);
    return p;
}

} // namespace press
