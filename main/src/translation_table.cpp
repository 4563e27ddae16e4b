#include "translation_table.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "po_catalog.hpp"
#include "utils.hpp"

#include <algorithm>

namespace fs = std::filesystem;

TranslationTable TranslationTable::load_from_dir(const fs::path& dir) {
    if (!fs::is_directory(dir)) {
        throw PofillException(string_format("error.table_dir_missing", dir.string()));
    }

    std::vector<fs::path> compendia;
    for (const auto& dir_entry : fs::directory_iterator(dir)) {
        if (dir_entry.is_regular_file() && dir_entry.path().extension() == ".po") {
            compendia.push_back(dir_entry.path());
        }
    }
    std::sort(compendia.begin(), compendia.end());

    TranslationTable table;
    for (const auto& path : compendia) {
        std::string language = path.stem().string();
        size_t count = table.load_compendium(language, path);
        log_debug(string_format("debug.table_loaded", language, count, path.string()));
    }
    return table;
}

size_t TranslationTable::load_compendium(const std::string& language, const fs::path& path) {
    PoCatalog compendium = parse_catalog(read_text_file(path));

    // The language is known even if the compendium holds no usable entry yet
    auto& table = tables_[language];
    size_t count = 0;
    for (const auto& entry : compendium.entries) {
        if (entry.is_plural()) continue;

        std::string source = entry.msgid();
        std::string translation = entry.msgstr();
        if (source.empty() || translation.empty()) continue;

        auto [it, inserted] = table.insert_or_assign(std::move(source), std::move(translation));
        if (!inserted) {
            log_warning(string_format("warning.duplicate_table_entry", it->first, path.string()));
        }
        ++count;
    }
    return count;
}

void TranslationTable::add(const std::string& language, const std::string& source, const std::string& translation) {
    tables_[language][source] = translation;
}

bool TranslationTable::has_language(const std::string& language) const {
    return tables_.find(language) != tables_.end();
}

const std::string* TranslationTable::lookup(const std::string& language, const std::string& source) const {
    auto table_it = tables_.find(language);
    if (table_it == tables_.end()) return nullptr;

    auto it = table_it->second.find(source);
    return (it != table_it->second.end()) ? &it->second : nullptr;
}

size_t TranslationTable::size(const std::string& language) const {
    auto it = tables_.find(language);
    return (it != tables_.end()) ? it->second.size() : 0;
}

std::vector<std::string> TranslationTable::languages() const {
    std::vector<std::string> result;
    result.reserve(tables_.size());
    for (const auto& [language, table] : tables_) {
        result.push_back(language);
    }
    return result;
}
