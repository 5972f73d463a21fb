#include "press/patch/JsonDecoder.hpp"
#include "press/errors.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace press {

using json = nlohmann::json;

namespace {

// Pulls the JSON document out of a reply that may carry a markdown fence or
// prose. Fences inside string values (markdown edits) do not end the block:
// the closing fence must follow the document's final '}'.
std::string extract_json_payload(const std::string& raw) {
    const char* ws = " \t\r\n";
    std::size_t first = raw.find_first_not_of(ws);
    if (first != std::string::npos) {
        std::string trimmed = raw.substr(first, raw.find_last_not_of(ws) - first + 1);
        if (json::accept(trimmed)) return trimmed;
    }

    std::size_t fence = raw.find("```json");
    if (fence != std::string::npos) {
        std::size_t body = fence + 7;
        for (std::size_t close = raw.find("```", body); close != std::string::npos;
             close = raw.find("```", close + 3)) {
            std::size_t last = raw.find_last_not_of(ws, close - 1);
            if (last == std::string::npos || last < body || raw[last] != '}') continue;
            std::string candidate = raw.substr(body, close - body);
            if (json::accept(candidate)) return candidate;
        }
    }

    std::size_t open = raw.find('{');
    std::size_t last = raw.rfind('}');
    if (open == std::string::npos || last == std::string::npos || last < open) return raw;
    return raw.substr(open, last - open + 1);
}

json parse_document(const std::string& response) {
    json doc;
    try {
        doc = json::parse(extract_json_payload(response));
    } catch (const json::parse_error& e) {
        throw PatchFormatError(e.what());
    }
    if (!doc.is_object()) throw PatchFormatError("expected a JSON object at the top level");
    return doc;
}

std::size_t json_part_id(const json& value) {
    if (value.is_number_unsigned()) return value.get<std::size_t>();
    if (value.is_number_integer()) {
        auto v = value.get<long long>();
        return v > 0 ? static_cast<std::size_t>(v) : 0;
    }
    if (value.is_string()) return parse_part_id(value.get<std::string>());
    return 0;
}

std::string string_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

const json* array_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_array()) return nullptr;
    return &*it;
}

} // namespace

PatchResult JsonDecoder::decode_patch(const std::string& response) const {
    json doc = parse_document(response);
    PatchResult result;

    if (const json* updated = array_field(doc, "updated_files")) {
        for (const auto& entry : *updated) {
            if (!entry.is_object()) continue;
            UpdatedFile file;
            file.file_path = string_field(entry, "file_path");
            if (file.file_path.empty()) {
                spdlog::warn("Skipping updated_files entry without file_path");
                continue;
            }
            if (const json* parts = array_field(entry, "parts")) {
                for (const auto& part : *parts) {
                    if (!part.is_object()) continue;
                    std::size_t id = part.contains("part_id") ? json_part_id(part["part_id"]) : 0;
                    if (id == 0) spdlog::warn("Unreadable part id in {}; the part will not be applied", file.file_path);
                    file.parts.push_back({id, string_field(part, "content")});
                }
            }
            if (!file.parts.empty()) result.updated.push_back(std::move(file));
        }
    }

    if (const json* created = array_field(doc, "new_files")) {
        for (const auto& entry : *created) {
            if (!entry.is_object()) continue;
            NewFile file{string_field(entry, "file_path"), string_field(entry, "content")};
            if (file.file_path.empty()) {
                spdlog::warn("Skipping new_files entry without file_path");
                continue;
            }
            result.created.push_back(std::move(file));
        }
    }

    result.free_text = string_field(doc, "response");
    spdlog::info("Decoded patch: {} updated, {} new, {} bytes of free text",
                 result.updated.size(), result.created.size(), result.free_text.size());
    return result;
}

SelectionResult JsonDecoder::decode_selection(const std::string& response) const {
    json doc = parse_document(response);
    SelectionResult result;

    if (const json* entries = array_field(doc, "parts_to_edit")) {
        for (const auto& entry : *entries) {
            if (!entry.is_object()) continue;
            std::string path = string_field(entry, "file_path");
            if (path.empty()) continue;
            auto& slot = result.selection[path];
            if (const json* parts = array_field(entry, "parts")) {
                for (const auto& id : *parts) {
                    std::size_t value = json_part_id(id);
                    if (value > 0) slot.insert(value);
                }
            }
        }
    }

    result.preprocessor_prompt = string_field(doc, "preprocessor_prompt");
    spdlog::info("Decoded part selection for {} files", result.selection.size());
    return result;
}

} // namespace press
