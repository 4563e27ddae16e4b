#include "catalog_processor.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>

namespace fs = std::filesystem;

size_t FillReport::total_filled() const {
    size_t total = 0;
    for (const auto& result : results) {
        total += result.filled;
    }
    return total;
}

bool FillReport::has_failures() const {
    return std::any_of(results.begin(), results.end(),
                       [](const CatalogResult& r) { return r.status == CatalogStatus::FAILED; });
}

void commit_catalog(const fs::path& path, const std::string& content) {
    fs::path tmp_path = path.string() + ".tmp";
    const std::string expected_hash = calculate_sha256_of(content);

    try {
        write_text_file(tmp_path, content);

        std::string actual_hash = calculate_sha256(tmp_path);
        if (actual_hash != expected_hash) {
            throw PofillException(string_format("error.verify_failed", tmp_path.string(), expected_hash, actual_hash));
        }

        std::error_code ec;
        auto perms = fs::status(path, ec).permissions();
        if (!ec) {
            fs::permissions(tmp_path, perms, ec);
        }

        replace_file(tmp_path, path);
    } catch (const std::exception&) {
        std::error_code ec;
        fs::remove(tmp_path, ec);
        throw;
    }

    log_debug(string_format("debug.catalog_written", path.string(), expected_hash));
}

CatalogResult fill_catalog_file(const fs::path& path, const std::string& language, const FillPolicy& policy) {
    CatalogResult result;
    result.language = language;
    result.path = path;

    if (!fs::exists(path)) {
        result.status = CatalogStatus::SKIPPED_MISSING_FILE;
        log_info(string_format("info.skip_missing_file", path.string()));
        return result;
    }

    if (!policy.covers(language)) {
        result.status = CatalogStatus::SKIPPED_UNKNOWN_LANGUAGE;
        log_info(string_format("info.skip_unknown_language", language));
        return result;
    }

    try {
        PoCatalog catalog = parse_catalog(read_text_file(path));
        if (catalog.ignored_lines > 0) {
            log_warning(string_format("warning.stray_lines", path.string(), catalog.ignored_lines));
        }

        result.filled = policy.fill_catalog(catalog, language);
        if (result.filled == 0) {
            result.status = CatalogStatus::UNCHANGED;
        } else {
            if (!get_dry_run_mode()) {
                commit_catalog(path, rebuild_catalog(catalog));
            }
            result.status = CatalogStatus::FILLED;
        }
        log_info(string_format("info.lang_filled", language, result.filled));
    } catch (const PofillException& e) {
        result.status = CatalogStatus::FAILED;
        result.error = e.what();
        log_error(string_format("error.catalog_failed", path.string(), e.what()));
    } catch (const fs::filesystem_error& e) {
        result.status = CatalogStatus::FAILED;
        result.error = e.what();
        log_error(string_format("error.catalog_failed", path.string(), e.what()));
    }

    return result;
}

FillReport fill_catalogs(const std::vector<std::string>& languages, const TranslationTable& table) {
    FillPolicy policy(table);
    FillReport report;

    if (get_dry_run_mode()) {
        log_info(get_string("info.dry_run"));
    }

    for (const auto& language : languages) {
        fs::path path;
        try {
            path = catalog_path(language);
        } catch (const PofillException& e) {
            CatalogResult result;
            result.language = language;
            result.status = CatalogStatus::FAILED;
            result.error = e.what();
            log_error(string_format("error.catalog_failed", language, e.what()));
            report.results.push_back(result);
            continue;
        }
        report.results.push_back(fill_catalog_file(path, language, policy));
    }

    log_info(string_format("info.fill_total", report.total_filled(), languages.size()));
    if (report.has_failures()) {
        size_t failed = std::count_if(report.results.begin(), report.results.end(),
                                      [](const CatalogResult& r) { return r.status == CatalogStatus::FAILED; });
        log_error(string_format("error.catalogs_failed", failed));
    }
    return report;
}

CatalogStats compute_catalog_stats(const PoCatalog& catalog, const std::string& language, const FillPolicy& policy) {
    CatalogStats stats;
    stats.language = language;

    for (const auto& entry : catalog.entries) {
        if (entry.is_header()) continue;

        ++stats.total;
        if (entry.is_plural()) {
            ++stats.plural;
        }
        if (entry.msgstr().empty()) {
            ++stats.untranslated;
            if (policy.can_fill(entry, language)) {
                ++stats.fillable;
            }
        } else {
            ++stats.translated;
        }
    }
    return stats;
}

StatsReport collect_stats(const std::vector<std::string>& languages, const TranslationTable& table) {
    FillPolicy policy(table);
    StatsReport report;

    for (const auto& language : languages) {
        try {
            fs::path path = catalog_path(language);
            if (!fs::exists(path)) {
                log_info(string_format("info.skip_missing_file", path.string()));
                continue;
            }

            CatalogStats stats = compute_catalog_stats(parse_catalog(read_text_file(path)), language, policy);
            log_info(string_format("info.lang_stats", language, stats.total, stats.translated,
                                   stats.untranslated, stats.fillable, stats.plural));
            report.catalogs.push_back(stats);
        } catch (const PofillException& e) {
            ++report.failed;
            log_error(string_format("error.catalog_failed", language, e.what()));
        } catch (const fs::filesystem_error& e) {
            ++report.failed;
            log_error(string_format("error.catalog_failed", language, e.what()));
        }
    }

    if (report.failed > 0) {
        log_error(string_format("error.catalogs_failed", report.failed));
    }
    return report;
}
