#pragma once

#include "po_catalog.hpp"
#include "translation_table.hpp"

#include <string>

// Fills empty translations from the table. Never overwrites a non-empty msgstr.
class FillPolicy {
public:
    explicit FillPolicy(const TranslationTable& table);

    bool apply(PoEntry& entry, const std::string& language) const;
    size_t fill_catalog(PoCatalog& catalog, const std::string& language) const;

    bool covers(const std::string& language) const { return table_.has_language(language); }

    // True when apply() would fill the entry.
    bool can_fill(const PoEntry& entry, const std::string& language) const;

private:
    const std::string* find_fill(const PoEntry& entry, const std::string& language) const;

    const TranslationTable& table_;
};
