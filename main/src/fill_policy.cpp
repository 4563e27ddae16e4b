#include "fill_policy.hpp"
#include "localization.hpp"
#include "po_codec.hpp"
#include "utils.hpp"

FillPolicy::FillPolicy(const TranslationTable& table) : table_(table) {}

const std::string* FillPolicy::find_fill(const PoEntry& entry, const std::string& language) const {
    if (entry.is_plural() || entry.msgid_lines.empty()) {
        return nullptr;
    }

    std::string msgid = entry.msgid();
    if (msgid.empty() || !entry.msgstr().empty()) {
        return nullptr;
    }

    const std::string* translation = table_.lookup(language, msgid);
    if (!translation || translation->empty()) {
        return nullptr;
    }
    return translation;
}

bool FillPolicy::can_fill(const PoEntry& entry, const std::string& language) const {
    return find_fill(entry, language) != nullptr;
}

bool FillPolicy::apply(PoEntry& entry, const std::string& language) const {
    const std::string* translation = find_fill(entry, language);
    if (!translation) {
        return false;
    }

    bool crlf = !entry.msgstr_lines.empty() && entry.msgstr_lines.front().ends_with('\r');
    entry.msgstr_lines = encode_field(KEYWORD_MSGSTR, *translation);
    if (crlf) {
        entry.msgstr_lines.front() += '\r';
    }
    log_debug(string_format("debug.entry_filled", language, entry.msgid()));
    return true;
}

size_t FillPolicy::fill_catalog(PoCatalog& catalog, const std::string& language) const {
    size_t filled = 0;
    for (auto& entry : catalog.entries) {
        if (apply(entry, language)) {
            ++filled;
        }
    }
    return filled;
}
