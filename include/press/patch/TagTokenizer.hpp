#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace press {

struct StartTag {
    std::string name;
    std::map<std::string, std::string> attrs; // values are entity-unescaped
    bool self_closing = false;
    std::string raw; // source text of the tag

    std::string attr(const std::string& key) const {
        auto it = attrs.find(key);
        return it == attrs.end() ? std::string() : it->second;
    }
    bool has_attr(const std::string& key) const { return attrs.count(key) > 0; }
};

struct EndTag {
    std::string name;
    std::string raw;
};

struct TextToken {
    std::string text; // entity-unescaped, untrimmed
};

struct CDataToken {
    std::string text; // verbatim
};

using TagToken = std::variant<StartTag, EndTag, TextToken, CDataToken>;

// Forward-only lexer for the tag response format. Comments, processing
// instructions and declarations are skipped. A '<' that does not open markup is
// kept as text. Throws PatchFormatError on an unterminated tag, attribute
// quote, comment or CDATA section. The input is borrowed and must outlive the
// tokenizer.
class TagTokenizer {
public:
    explicit TagTokenizer(const std::string& input) : in_(input) {}
    explicit TagTokenizer(std::string&&) = delete;

    // Next token, or nullopt at end of input.
    std::optional<TagToken> next();

    std::size_t position() const { return pos_; }

private:
    const std::string& in_;
    std::size_t pos_ = 0;

    bool opens_markup(std::size_t at) const;
    bool skip_ignorable();
    StartTag read_start_tag();
    EndTag read_end_tag();
    std::string read_name();
    void skip_ws();
};

// Resolves the five predefined entities and numeric character references.
// Unknown entities are left untouched.
std::string unescape_entities(const std::string& raw);

} // namespace press
