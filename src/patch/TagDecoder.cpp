#include "press/patch/TagDecoder.hpp"
#include "press/patch/TagTokenizer.hpp"
#include <sstream>
#include <spdlog/spdlog.h>

namespace press {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    std::size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    std::size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::string join(const std::vector<std::string>& pieces, const std::string& sep) {
    std::string out;
    for (std::size_t i = 0; i < pieces.size(); ++i) {
        if (i > 0) out += sep;
        out += pieces[i];
    }
    return out;
}

// Text nodes are trimmed; CDATA is taken verbatim. Returns false for
// whitespace-only text.
bool token_text(const TagToken& token, std::string& out) {
    if (auto* t = std::get_if<TextToken>(&token)) {
        out = trim(t->text);
        return !out.empty();
    }
    if (auto* c = std::get_if<CDataToken>(&token)) {
        out = c->text;
        return true;
    }
    return false;
}

// --- PATCH STATE MACHINE ---

enum class State { Idle, InFileBody, InNewFileBody, InPartBody, InFreeText };

// Part and new_file bodies hold only text and CDATA. A body carrying any
// other tag (unescaped generics, HTML) is dropped whole.
class PatchMachine {
public:
    void feed(const TagToken& token) {
        if (state_ == State::InFreeText) {
            feed_free_text(token);
        } else if (auto* start = std::get_if<StartTag>(&token)) {
            on_start(*start);
        } else if (auto* end = std::get_if<EndTag>(&token)) {
            on_end(*end);
        } else {
            std::string text;
            if (token_text(token, text)) on_text(text);
        }
    }

    PatchResult finish() {
        if (state_ == State::InPartBody) leave_part();
        switch (state_) {
            case State::InFileBody:
            case State::InNewFileBody:
                spdlog::warn("Response ended inside <{}> for {}; discarding it", container_name(), path_);
                break;
            case State::InFreeText:
                close_free_text();
                break;
            default:
                break;
        }
        state_ = State::Idle;
        return std::move(result_);
    }

private:
    State state_ = State::Idle;
    State part_parent_ = State::Idle;
    std::string path_;
    std::vector<Part> parts_;          // <file> body
    std::vector<std::string> pieces_;  // <new_file> and <response> bodies
    bool part_broken_ = false;
    bool new_file_broken_ = false;
    PatchResult result_;

    const char* container_name() const {
        return state_ == State::InNewFileBody ? "new_file" : "file";
    }

    void open_container(State next, const StartTag& tag) {
        path_ = tag.attr("path");
        parts_.clear();
        pieces_.clear();
        part_broken_ = false;
        new_file_broken_ = false;
        if (path_.empty()) {
            spdlog::warn("Skipping <{}> without a path attribute", tag.name);
            return;
        }
        state_ = next;
    }

    void on_start(const StartTag& tag) {
        switch (state_) {
            case State::Idle:
                if (tag.self_closing) return;
                if (tag.name == "file") open_container(State::InFileBody, tag);
                else if (tag.name == "new_file") open_container(State::InNewFileBody, tag);
                else if (tag.name == "response") {
                    pieces_.clear();
                    state_ = State::InFreeText;
                }
                return;

            case State::InFileBody:
                if (tag.name == "part") {
                    parts_.push_back({parse_part_id(tag.attr("id")), ""});
                    if (parts_.back().part_id == 0) {
                        spdlog::warn("Unreadable part id '{}' in {}; the part will not be applied", tag.attr("id"), path_);
                    }
                    enter_part();
                    if (tag.self_closing) leave_part();
                } else if (tag.name == "file" || tag.name == "new_file") {
                    spdlog::warn("<{}> opened before </file> for {}", tag.name, path_);
                    close_file();
                    on_start(tag);
                }
                return;

            case State::InNewFileBody:
                if (tag.name == "part") {
                    pieces_.emplace_back();
                    enter_part();
                    if (tag.self_closing) leave_part();
                } else {
                    break_new_file(tag.raw);
                }
                return;

            case State::InPartBody:
                if (tag.name == "part") {
                    // Missing </part>: close the current one and start a sibling.
                    leave_part();
                    on_start(tag);
                } else {
                    break_part(tag.raw);
                }
                return;

            case State::InFreeText:
                return;
        }
    }

    void on_end(const EndTag& tag) {
        switch (state_) {
            case State::Idle:
                return;
            case State::InFileBody:
                if (tag.name == "file") close_file();
                return;
            case State::InNewFileBody:
                if (tag.name == "new_file") close_new_file();
                else break_new_file(tag.raw);
                return;
            case State::InPartBody:
                if (tag.name == "part") {
                    leave_part();
                } else if (tag.name == "file" || tag.name == "new_file") {
                    leave_part();
                    on_end(tag);
                } else {
                    break_part(tag.raw);
                }
                return;
            case State::InFreeText:
                return;
        }
    }

    void on_text(const std::string& text) {
        switch (state_) {
            case State::InPartBody:
                if (part_parent_ == State::InFileBody) parts_.back().content += text;
                else pieces_.back() += text;
                return;
            case State::InNewFileBody:
                if (pieces_.empty()) pieces_.emplace_back();
                pieces_.back() += text;
                return;
            default:
                return; // text between containers is commentary the format does not capture
        }
    }

    // Stray markup in free text stays as written; whitespace is trimmed per block.
    void feed_free_text(const TagToken& token) {
        if (auto* start = std::get_if<StartTag>(&token)) {
            if (start->name == "part") pieces_.emplace_back();
            else append_free_text(start->raw);
        } else if (auto* end = std::get_if<EndTag>(&token)) {
            if (end->name == "response") close_free_text();
            else if (end->name != "part") append_free_text(end->raw);
        } else if (auto* text = std::get_if<TextToken>(&token)) {
            append_free_text(text->text);
        } else if (auto* cdata = std::get_if<CDataToken>(&token)) {
            append_free_text(cdata->text);
        }
    }

    void append_free_text(const std::string& text) {
        if (pieces_.empty()) pieces_.emplace_back();
        pieces_.back() += text;
    }

    void enter_part() {
        part_parent_ = state_;
        state_ = State::InPartBody;
    }

    void leave_part() {
        state_ = part_parent_;
        if (!part_broken_) return;
        part_broken_ = false;
        if (state_ == State::InFileBody) parts_.pop_back();
        else new_file_broken_ = true;
    }

    void break_part(const std::string& markup) {
        if (part_broken_) return;
        part_broken_ = true;
        if (part_parent_ == State::InFileBody) {
            spdlog::warn("Dropping part {} of {}: unexpected markup {} outside CDATA",
                         parts_.back().part_id, path_, markup);
        } else {
            spdlog::warn("Unexpected markup {} outside CDATA in new file {}", markup, path_);
        }
    }

    void break_new_file(const std::string& markup) {
        if (!new_file_broken_) spdlog::warn("Unexpected markup {} outside CDATA in new file {}", markup, path_);
        new_file_broken_ = true;
    }

    void close_file() {
        if (parts_.empty()) {
            spdlog::debug("<file> for {} carried no usable parts", path_);
        } else {
            result_.updated.push_back({path_, std::move(parts_)});
        }
        parts_.clear();
        state_ = State::Idle;
    }

    void close_new_file() {
        if (new_file_broken_) {
            spdlog::warn("Discarding new file {}", path_);
        } else {
            result_.created.push_back({path_, join(pieces_, "\n")});
        }
        pieces_.clear();
        new_file_broken_ = false;
        state_ = State::Idle;
    }

    void close_free_text() {
        std::vector<std::string> blocks;
        for (const auto& piece : pieces_) {
            std::string block = trim(piece);
            if (!block.empty()) blocks.push_back(std::move(block));
        }
        std::string text = join(blocks, "\n");
        if (!text.empty()) {
            if (!result_.free_text.empty()) result_.free_text += "\n";
            result_.free_text += text;
        }
        pieces_.clear();
        state_ = State::Idle;
    }
};

std::vector<std::size_t> parse_id_list(const std::string& raw) {
    std::vector<std::size_t> ids;
    std::stringstream ss(raw);
    std::string item;
    while (std::getline(ss, item, ',')) {
        std::size_t id = parse_part_id(item);
        if (id > 0) ids.push_back(id);
    }
    return ids;
}

} // namespace

PatchResult TagDecoder::decode_patch(const std::string& response) const {
    TagTokenizer tokenizer(response);
    PatchMachine machine;
    while (auto token = tokenizer.next()) machine.feed(*token);

    auto result = machine.finish();
    spdlog::info("Decoded patch: {} updated, {} new, {} bytes of free text",
                 result.updated.size(), result.created.size(), result.free_text.size());
    return result;
}

SelectionResult TagDecoder::decode_selection(const std::string& response) const {
    TagTokenizer tokenizer(response);
    SelectionResult result;

    enum class Sel { Outside, InFile, InPrompt } state = Sel::Outside;
    std::string path;
    std::string fallback_ids;
    std::string body;
    std::vector<std::string> prompt_pieces;

    while (auto token = tokenizer.next()) {
        if (auto* start = std::get_if<StartTag>(&*token)) {
            if (state != Sel::Outside || start->self_closing) continue;
            if (start->name == "file" && start->has_attr("path")) {
                path = start->attr("path");
                fallback_ids = start->attr("parts");
                body.clear();
                state = Sel::InFile;
            } else if (start->name == "preprocessor_prompt") {
                state = Sel::InPrompt;
            }
        } else if (auto* end = std::get_if<EndTag>(&*token)) {
            if (state == Sel::InFile && end->name == "file") {
                // Ids normally sit in the body; older replies put them in the parts attribute.
                auto ids = parse_id_list(body);
                if (ids.empty()) ids = parse_id_list(fallback_ids);
                auto& slot = result.selection[path];
                slot.insert(ids.begin(), ids.end());
                state = Sel::Outside;
            } else if (state == Sel::InPrompt && end->name == "preprocessor_prompt") {
                state = Sel::Outside;
            }
        } else {
            std::string text;
            if (!token_text(*token, text)) continue;
            if (state == Sel::InFile) body += text;
            else if (state == Sel::InPrompt) prompt_pieces.push_back(text);
        }
    }

    result.preprocessor_prompt = join(prompt_pieces, "\n");
    spdlog::info("Decoded part selection for {} files", result.selection.size());
    return result;
}

} // namespace press
