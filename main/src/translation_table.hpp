#pragma once

#include <string>
#include <string_view>
#include <map>
#include <unordered_map>
#include <vector>
#include <filesystem>

// Per-language mapping from decoded msgid to decoded translation.
class TranslationTable {
public:
    using StringMap = std::unordered_map<std::string, std::string>;

    TranslationTable() = default;

    // Reads every <language>.po compendium in the directory.
    static TranslationTable load_from_dir(const std::filesystem::path& dir);

    // Loads one compendium, returns the number of translations taken from it.
    size_t load_compendium(const std::string& language, const std::filesystem::path& path);

    void add(const std::string& language, const std::string& source, const std::string& translation);

    bool has_language(const std::string& language) const;
    const std::string* lookup(const std::string& language, const std::string& source) const;

    size_t size(const std::string& language) const;
    std::vector<std::string> languages() const;

private:
    std::map<std::string, StringMap, std::less<>> tables_;
};
