#include "po_codec.hpp"

namespace {
    // Text between the first and the last quote of a line.
    bool quoted_fragment(std::string_view line, std::string_view& fragment) {
        auto first = line.find('"');
        if (first == std::string_view::npos) return false;
        auto last = line.rfind('"');
        if (last == first) return false;
        fragment = line.substr(first + 1, last - first - 1);
        return true;
    }
}

std::string unescape_po_string(std::string_view raw) {
    std::string result;
    result.reserve(raw.size());

    for (size_t idx = 0; idx < raw.size(); ++idx) {
        if (raw[idx] != '\\' || idx + 1 == raw.size()) {
            result += raw[idx];
            continue;
        }

        ++idx;
        switch (raw[idx]) {
        case 'n': result += '\n'; break;
        case 'r': result += '\r'; break;
        case 't': result += '\t'; break;
        case '\\': result += '\\'; break;
        case '"': result += '"'; break;
        default:
            result += '\\';
            result += raw[idx];
            break;
        }
    }
    return result;
}

std::string escape_po_string(std::string_view value) {
    std::string result;
    result.reserve(value.size());

    for (const char c : value) {
        switch (c) {
        case '\n': result += "\\n"; break;
        case '\r': result += "\\r"; break;
        case '\t': result += "\\t"; break;
        case '\\': result += "\\\\"; break;
        case '"': result += "\\\""; break;
        default: result += c; break;
        }
    }
    return result;
}

std::string decode_field(const std::vector<std::string>& field_lines) {
    std::vector<std::string> parts;
    parts.reserve(field_lines.size());
    size_t total = 0;

    for (const auto& line : field_lines) {
        std::string_view fragment;
        if (quoted_fragment(line, fragment)) {
            parts.push_back(unescape_po_string(fragment));
            total += parts.back().size();
        }
    }

    std::string value;
    value.reserve(total);
    for (const auto& part : parts) {
        value += part;
    }
    return value;
}

std::vector<std::string> encode_field(std::string_view keyword, std::string_view value) {
    std::string line;
    line.reserve(keyword.size() + value.size() + 3);
    line += keyword;
    line += " \"";
    line += escape_po_string(value);
    line += '"';
    return {line};
}
