#pragma once

#include <string>
#include <string_view>
#include <vector>

// Field keywords
inline constexpr std::string_view KEYWORD_MSGCTXT = "msgctxt";
inline constexpr std::string_view KEYWORD_MSGID = "msgid";
inline constexpr std::string_view KEYWORD_MSGID_PLURAL = "msgid_plural";
inline constexpr std::string_view KEYWORD_MSGSTR = "msgstr";

// Returns the logical value of a field: the quoted fragments of every line,
// unescaped and concatenated. Lines without a quoted fragment add nothing.
std::string decode_field(const std::vector<std::string>& field_lines);

// Single-line field `<keyword> "<escaped value>"`.
std::vector<std::string> encode_field(std::string_view keyword, std::string_view value);

// C-style escapes used by gettext: \n \r \t \\ \".
// Unknown sequences are kept verbatim.
std::string unescape_po_string(std::string_view raw);
std::string escape_po_string(std::string_view value);
