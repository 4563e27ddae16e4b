#pragma once

#include <string>
#include <string_view>
#include <vector>

// One catalog record. Every line is kept exactly as read so that untouched
// entries serialize back byte for byte.
struct PoEntry {
    std::vector<std::string> comments;
    std::vector<std::string> msgctxt_lines;
    std::vector<std::string> msgid_lines;
    std::vector<std::string> msgid_plural_lines;
    std::vector<std::string> msgstr_lines;

    std::string msgid() const;
    std::string msgstr() const;
    bool is_plural() const { return !msgid_plural_lines.empty(); }
    bool is_header() const;
};

struct PoCatalog {
    std::vector<PoEntry> entries;
    // Lines after the last entry that no msgid follows (usually obsolete #~ entries),
    // including the blank lines separating them.
    std::vector<std::string> trailing_lines;
    // Quoted continuation lines found outside of any field.
    size_t ignored_lines = 0;
    // "\r\n" when the first line of the text ends that way.
    std::string line_ending = "\n";
};

enum class LineKind {
    BLANK,
    COMMENT,
    MSGCTXT,
    MSGID,
    MSGID_PLURAL,
    MSGSTR,
    CONTINUATION,
    OTHER
};

enum class ParserState {
    IDLE,
    IN_COMMENTS,
    IN_MSGCTXT,
    IN_MSGID,
    IN_MSGID_PLURAL,
    IN_MSGSTR
};

LineKind classify_line(std::string_view line);

PoCatalog parse_catalog(std::string_view text);
std::string rebuild_catalog(const PoCatalog& catalog);
