#include "po_catalog.hpp"
#include "po_codec.hpp"

#include <utility>

std::string PoEntry::msgid() const {
    return decode_field(msgid_lines);
}

std::string PoEntry::msgstr() const {
    return decode_field(msgstr_lines);
}

bool PoEntry::is_header() const {
    return msgctxt_lines.empty() && msgid().empty();
}

namespace {
    bool starts_with_keyword(std::string_view line, std::string_view keyword) {
        return line.size() > keyword.size() && line.starts_with(keyword) && line[keyword.size()] == ' ';
    }

    bool is_blank(std::string_view line) {
        return line.find_first_not_of(" \t\r\v\f") == std::string_view::npos;
    }

    class CatalogParser {
    public:
        explicit CatalogParser(std::string line_ending) {
            catalog_.line_ending = std::move(line_ending);
        }

        void feed(std::string_view line) {
            switch (classify_line(line)) {
            case LineKind::BLANK:
                // A blank line terminates an entry once its translation was seen.
                if (seal_if_translation_open()) {
                    state_ = ParserState::IDLE;
                } else if (state_ == ParserState::IN_COMMENTS) {
                    mark_comment_break(line);
                }
                break;
            case LineKind::COMMENT:
                seal_if_translation_open();
                current_.comments.emplace_back(line);
                if (state_ == ParserState::IDLE) {
                    state_ = ParserState::IN_COMMENTS;
                }
                break;
            case LineKind::MSGCTXT:
                seal_if_translation_open();
                current_.msgctxt_lines.emplace_back(line);
                state_ = ParserState::IN_MSGCTXT;
                break;
            case LineKind::MSGID:
                // msgid right after msgstr with no blank line in between starts a new entry
                seal_if_translation_open();
                current_.msgid_lines.emplace_back(line);
                state_ = ParserState::IN_MSGID;
                break;
            case LineKind::MSGID_PLURAL:
                current_.msgid_plural_lines.emplace_back(line);
                state_ = ParserState::IN_MSGID_PLURAL;
                break;
            case LineKind::MSGSTR:
                current_.msgstr_lines.emplace_back(line);
                state_ = ParserState::IN_MSGSTR;
                break;
            case LineKind::CONTINUATION:
                if (auto* field = active_field()) {
                    field->emplace_back(line);
                } else {
                    ++catalog_.ignored_lines;
                }
                break;
            case LineKind::OTHER:
                if (auto* field = active_field()) {
                    field->emplace_back(line);
                } else {
                    current_.comments.emplace_back(line);
                    state_ = ParserState::IN_COMMENTS;
                }
                break;
            }
        }

        PoCatalog finish() {
            if (!current_.msgid_lines.empty()) {
                seal();
            } else {
                auto& trailing = catalog_.trailing_lines;
                auto next_break = comment_breaks_.begin();
                for (size_t idx = 0; idx < current_.comments.size(); ++idx) {
                    if (next_break != comment_breaks_.end() && next_break->first == idx) {
                        trailing.push_back(next_break->second);
                        ++next_break;
                    }
                    trailing.push_back(current_.comments[idx]);
                }
                for (auto* lines : {&current_.msgctxt_lines, &current_.msgid_plural_lines, &current_.msgstr_lines}) {
                    trailing.insert(trailing.end(), lines->begin(), lines->end());
                }
                current_ = PoEntry{};
                comment_breaks_.clear();
            }
            state_ = ParserState::IDLE;
            return std::move(catalog_);
        }

    private:
        std::vector<std::string>* active_field() {
            switch (state_) {
            case ParserState::IN_MSGCTXT: return &current_.msgctxt_lines;
            case ParserState::IN_MSGID: return &current_.msgid_lines;
            case ParserState::IN_MSGID_PLURAL: return &current_.msgid_plural_lines;
            case ParserState::IN_MSGSTR: return &current_.msgstr_lines;
            case ParserState::IDLE:
            case ParserState::IN_COMMENTS:
                break;
            }
            return nullptr;
        }

        bool seal_if_translation_open() {
            if (state_ != ParserState::IN_MSGSTR || current_.msgid_lines.empty()) {
                return false;
            }
            seal();
            return true;
        }

        void seal() {
            catalog_.entries.push_back(std::move(current_));
            current_ = PoEntry{};
            comment_breaks_.clear();
            state_ = ParserState::IDLE;
        }

        // Remembers one blank line between comment blocks. It is only written
        // back if the comments end up after the last entry.
        void mark_comment_break(std::string_view line) {
            size_t position = current_.comments.size();
            if (position == 0) return;
            if (!comment_breaks_.empty() && comment_breaks_.back().first == position) return;
            comment_breaks_.emplace_back(position, std::string(line));
        }

        PoCatalog catalog_;
        PoEntry current_;
        ParserState state_ = ParserState::IDLE;
        std::vector<std::pair<size_t, std::string>> comment_breaks_;
    };

    void append_lines(std::string& out, const std::vector<std::string>& lines) {
        for (const auto& line : lines) {
            out += line;
            out += '\n';
        }
    }
}

LineKind classify_line(std::string_view line) {
    if (is_blank(line)) return LineKind::BLANK;
    if (line.front() == '#') return LineKind::COMMENT;
    if (line.front() == '"') return LineKind::CONTINUATION;
    if (starts_with_keyword(line, KEYWORD_MSGCTXT)) return LineKind::MSGCTXT;
    if (starts_with_keyword(line, KEYWORD_MSGID_PLURAL)) return LineKind::MSGID_PLURAL;
    if (starts_with_keyword(line, KEYWORD_MSGID)) return LineKind::MSGID;
    if (starts_with_keyword(line, KEYWORD_MSGSTR) || line.starts_with("msgstr[")) return LineKind::MSGSTR;
    return LineKind::OTHER;
}

PoCatalog parse_catalog(std::string_view text) {
    auto first_newline = text.find('\n');
    bool crlf = first_newline != std::string_view::npos && first_newline > 0 && text[first_newline - 1] == '\r';
    CatalogParser parser(crlf ? "\r\n" : "\n");

    size_t start = 0;
    while (true) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) {
            parser.feed(text.substr(start));
            break;
        }
        parser.feed(text.substr(start, end - start));
        start = end + 1;
    }
    return parser.finish();
}

std::string rebuild_catalog(const PoCatalog& catalog) {
    std::string out;
    bool first = true;

    for (const auto& entry : catalog.entries) {
        if (!first) out += catalog.line_ending;
        first = false;
        append_lines(out, entry.comments);
        append_lines(out, entry.msgctxt_lines);
        append_lines(out, entry.msgid_lines);
        append_lines(out, entry.msgid_plural_lines);
        append_lines(out, entry.msgstr_lines);
    }

    if (!catalog.trailing_lines.empty()) {
        if (!first) out += catalog.line_ending;
        append_lines(out, catalog.trailing_lines);
    }
    return out;
}
