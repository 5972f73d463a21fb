#include "press/patch/PatchDecoder.hpp"
#include "press/patch/JsonDecoder.hpp"
#include "press/patch/TagDecoder.hpp"
#include "press/errors.hpp"
#include <algorithm>
#include <cctype>
#include <limits>

namespace press {

ResponseFormat parse_response_format(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "xml" || lower == "tag") return ResponseFormat::Tag;
    if (lower == "json") return ResponseFormat::Json;
    throw ConfigError("unknown response format '" + name + "' (expected xml or json)");
}

std::string to_string(ResponseFormat format) {
    return format == ResponseFormat::Json ? "json" : "xml";
}

std::unique_ptr<PatchDecoder> make_decoder(ResponseFormat format) {
    if (format == ResponseFormat::Json) return std::make_unique<JsonDecoder>();
    return std::make_unique<TagDecoder>();
}

std::size_t parse_part_id(const std::string& raw) {
    std::size_t start = raw.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return 0;
    std::size_t end = raw.find_last_not_of(" \t\r\n");

    std::size_t value = 0;
    for (std::size_t i = start; i <= end; ++i) {
        unsigned char c = static_cast<unsigned char>(raw[i]);
        if (!std::isdigit(c)) return 0;
        std::size_t digit = c - '0';
        if (value > (std::numeric_limits<std::size_t>::max() - digit) / 10) return 0;
        value = value * 10 + digit;
    }
    return value;
}

} // namespace press
