#pragma once

#include "fill_policy.hpp"
#include "po_catalog.hpp"
#include "translation_table.hpp"

#include <string>
#include <vector>
#include <filesystem>

enum class CatalogStatus {
    FILLED,
    UNCHANGED,
    SKIPPED_MISSING_FILE,
    SKIPPED_UNKNOWN_LANGUAGE,
    FAILED
};

struct CatalogResult {
    std::string language;
    std::filesystem::path path;
    CatalogStatus status = CatalogStatus::UNCHANGED;
    size_t filled = 0;
    std::string error;
};

struct FillReport {
    std::vector<CatalogResult> results;

    size_t total_filled() const;
    bool has_failures() const;
};

struct CatalogStats {
    std::string language;
    size_t total = 0;
    size_t translated = 0;
    size_t untranslated = 0;
    size_t fillable = 0;
    size_t plural = 0;
};

struct StatsReport {
    std::vector<CatalogStats> catalogs;
    // Catalogs that could not be located or read
    size_t failed = 0;
};

CatalogResult fill_catalog_file(const std::filesystem::path& path, const std::string& language, const FillPolicy& policy);
FillReport fill_catalogs(const std::vector<std::string>& languages, const TranslationTable& table);

CatalogStats compute_catalog_stats(const PoCatalog& catalog, const std::string& language, const FillPolicy& policy);
StatsReport collect_stats(const std::vector<std::string>& languages, const TranslationTable& table);

// Writes <path>.tmp, checks its SHA256 against the content and renames it over path.
void commit_catalog(const std::filesystem::path& path, const std::string& content);
