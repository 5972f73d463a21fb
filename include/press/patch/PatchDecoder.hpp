#pragma once
#include <memory>
#include <string>
#include "press/patch/PatchTypes.hpp"

namespace press {

enum class ResponseFormat {
    Tag,  // <file>/<part>/<new_file>/<response> markup
    Json  // {"updated_files": [...], "new_files": [...], "response": "..."}
};

// "xml"/"tag" or "json". Throws ConfigError otherwise.
ResponseFormat parse_response_format(const std::string& name);
std::string to_string(ResponseFormat format);

// Turns one wire format of the model's reply into the shared result shapes.
// Both methods throw PatchFormatError when the reply is not well-formed at all;
// individual bad fragments are skipped.
class PatchDecoder {
public:
    virtual ~PatchDecoder() = default;

    virtual PatchResult decode_patch(const std::string& response) const = 0;
    virtual SelectionResult decode_selection(const std::string& response) const = 0;
};

std::unique_ptr<PatchDecoder> make_decoder(ResponseFormat format);

// Parses a part id; anything that is not a plain positive number yields 0.
std::size_t parse_part_id(const std::string& raw);

} // namespace press
