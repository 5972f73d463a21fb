#include "press/patch/TagTokenizer.hpp"
#include "press/errors.hpp"
#include <cctype>
#include <cstdint>

namespace press {

namespace {

bool is_name_start(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalpha(u) || c == '_';
}

bool is_name_char(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || c == '-' || c == '.' || c == ':';
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

bool decode_numeric(const std::string& body, std::uint32_t& cp) {
    // body is "#123" or "#x7B"
    if (body.size() < 2) return false;
    bool hex = (body[1] == 'x' || body[1] == 'X');
    std::size_t start = hex ? 2 : 1;
    if (start >= body.size()) return false;
    std::uint32_t value = 0;
    for (std::size_t i = start; i < body.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(body[i]);
        std::uint32_t digit;
        if (std::isdigit(c)) digit = c - '0';
        else if (hex && std::isxdigit(c)) digit = static_cast<std::uint32_t>(std::tolower(c) - 'a' + 10);
        else return false;
        value = value * (hex ? 16 : 10) + digit;
        if (value > 0x10FFFF) return false;
    }
    cp = value;
    return true;
}

} // namespace

std::string unescape_entities(const std::string& raw) {
    if (raw.find('&') == std::string::npos) return raw;

    std::string out;
    out.reserve(raw.size());
    std::size_t i = 0;
    while (i < raw.size()) {
        if (raw[i] != '&') {
            out += raw[i++];
            continue;
        }
        std::size_t semi = raw.find(';', i + 1);
        if (semi == std::string::npos || semi - i > 10) {
            out += raw[i++];
            continue;
        }
        std::string body = raw.substr(i + 1, semi - i - 1);
        std::uint32_t cp = 0;
        if (body == "lt") out += '<';
        else if (body == "gt") out += '>';
        else if (body == "amp") out += '&';
        else if (body == "quot") out += '"';
        else if (body == "apos") out += '\'';
        else if (!body.empty() && body[0] == '#' && decode_numeric(body, cp)) append_utf8(out, cp);
        else {
            out += raw[i++];
            continue;
        }
        i = semi + 1;
    }
    return out;
}

bool TagTokenizer::opens_markup(std::size_t at) const {
    if (at + 1 >= in_.size() || in_[at] != '<') return false;
    char c = in_[at + 1];
    if (c == '!' || c == '?' || is_name_start(c)) return true;
    return c == '/' && at + 2 < in_.size() && is_name_start(in_[at + 2]);
}

void TagTokenizer::skip_ws() {
    while (pos_ < in_.size() && is_space(in_[pos_])) pos_++;
}

std::string TagTokenizer::read_name() {
    std::size_t start = pos_;
    while (pos_ < in_.size() && is_name_char(in_[pos_])) pos_++;
    return in_.substr(start, pos_ - start);
}

bool TagTokenizer::skip_ignorable() {
    auto skip_to = [&](const char* terminator, const char* what) {
        std::size_t end = in_.find(terminator, pos_ + 2);
        if (end == std::string::npos) {
            throw PatchFormatError(std::string("unterminated ") + what + " at offset " + std::to_string(pos_));
        }
        pos_ = end + std::char_traits<char>::length(terminator);
        return true;
    };

    if (in_.compare(pos_, 4, "<!--") == 0) return skip_to("-->", "comment");
    if (in_.compare(pos_, 2, "<?") == 0) return skip_to("?>", "processing instruction");
    if (in_.compare(pos_, 2, "<!") == 0) return skip_to(">", "declaration");
    return false;
}

StartTag TagTokenizer::read_start_tag() {
    const std::size_t tag_offset = pos_;
    pos_++; // '<'
    StartTag tag;
    tag.name = read_name();

    for (;;) {
        skip_ws();
        if (pos_ >= in_.size()) {
            throw PatchFormatError("unterminated <" + tag.name + "> tag at offset " + std::to_string(tag_offset));
        }
        char c = in_[pos_];
        if (c == '>') {
            pos_++;
            break;
        }
        if (c == '/' && pos_ + 1 < in_.size() && in_[pos_ + 1] == '>') {
            tag.self_closing = true;
            pos_ += 2;
            break;
        }
        if (!is_name_start(c)) {
            pos_++; // stray character inside the tag
            continue;
        }

        std::string key = read_name();
        std::string value;
        skip_ws();
        if (pos_ < in_.size() && in_[pos_] == '=') {
            pos_++;
            skip_ws();
            if (pos_ >= in_.size()) {
                throw PatchFormatError("unterminated <" + tag.name + "> tag at offset " + std::to_string(tag_offset));
            }
            char q = in_[pos_];
            if (q == '"' || q == '\'') {
                std::size_t end = in_.find(q, pos_ + 1);
                if (end == std::string::npos) {
                    throw PatchFormatError("unterminated value of attribute '" + key + "' at offset " + std::to_string(pos_));
                }
                value = in_.substr(pos_ + 1, end - pos_ - 1);
                pos_ = end + 1;
            } else {
                std::size_t start = pos_;
                while (pos_ < in_.size() && !is_space(in_[pos_]) && in_[pos_] != '>' &&
                       !(in_[pos_] == '/' && pos_ + 1 < in_.size() && in_[pos_ + 1] == '>')) {
                    pos_++;
                }
                value = in_.substr(start, pos_ - start);
            }
        }
        tag.attrs.emplace(key, unescape_entities(value));
    }
    tag.raw = in_.substr(tag_offset, pos_ - tag_offset);
    return tag;
}

EndTag TagTokenizer::read_end_tag() {
    const std::size_t tag_offset = pos_;
    pos_ += 2; // "</"
    EndTag tag;
    tag.name = read_name();
    std::size_t gt = in_.find('>', pos_);
    if (gt == std::string::npos) {
        throw PatchFormatError("unterminated </" + tag.name + "> tag at offset " + std::to_string(tag_offset));
    }
    pos_ = gt + 1;
    tag.raw = in_.substr(tag_offset, pos_ - tag_offset);
    return tag;
}

std::optional<TagToken> TagTokenizer::next() {
    while (pos_ < in_.size()) {
        if (in_[pos_] == '<') {
            if (in_.compare(pos_, 9, "<![CDATA[") == 0) {
                std::size_t end = in_.find("]]>", pos_ + 9);
                if (end == std::string::npos) {
                    throw PatchFormatError("unterminated CDATA section at offset " + std::to_string(pos_));
                }
                CDataToken cdata{in_.substr(pos_ + 9, end - pos_ - 9)};
                pos_ = end + 3;
                return TagToken{std::move(cdata)};
            }
            if (skip_ignorable()) continue;
            if (pos_ + 2 < in_.size() && in_[pos_ + 1] == '/' && is_name_start(in_[pos_ + 2])) {
                return TagToken{read_end_tag()};
            }
            if (pos_ + 1 < in_.size() && is_name_start(in_[pos_ + 1])) {
                return TagToken{read_start_tag()};
            }
        }

        // Plain text up to the next markup; a lone '<' stays part of it.
        std::size_t start = pos_++;
        while (pos_ < in_.size() && !opens_markup(pos_)) pos_++;
        return TagToken{TextToken{unescape_entities(in_.substr(start, pos_ - start))}};
    }
    return std::nullopt;
}

} // namespace press
