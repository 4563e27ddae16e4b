#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <filesystem>

namespace fs = std::filesystem;

fs::path PO_DIR = "po";
fs::path TABLE_DIR = fs::path("po") / "table";
fs::path L10N_DIR = POFILL_L10N_DIR;
std::string CATALOG_EXTENSION = "po";

fs::path LINGUAS_FILE = fs::path("po") / "LINGUAS";

const std::vector<std::string> DEFAULT_LANGUAGES = {
    "uk", "de", "fr", "es", "it", "pl", "cs", "sk",
    "da", "sv", "nl", "pt", "be", "kk", "uz",
};

static bool g_table_dir_overridden = false;
static std::vector<std::string> g_language_override;

void set_po_dir(const std::string& po_dir) {
    PO_DIR = fs::path(po_dir).lexically_normal();
    if (PO_DIR.empty()) PO_DIR = ".";

    LINGUAS_FILE = PO_DIR / "LINGUAS";
    if (!g_table_dir_overridden) {
        TABLE_DIR = PO_DIR / "table";
    }
}

void set_table_dir(const std::string& table_dir) {
    if (table_dir.empty()) {
        g_table_dir_overridden = false;
        TABLE_DIR = PO_DIR / "table";
        return;
    }
    TABLE_DIR = fs::path(table_dir).lexically_normal();
    g_table_dir_overridden = true;
}

void set_l10n_dir(const std::string& l10n_dir) {
    L10N_DIR = fs::path(l10n_dir);
}

void set_catalog_extension(const std::string& extension) {
    std::string ext = extension;
    if (!ext.empty() && ext.front() == '.') {
        ext.erase(0, 1);
    }
    if (ext.empty()) {
        throw PofillException(get_string("error.empty_extension"));
    }
    CATALOG_EXTENSION = ext;
}

void set_languages(const std::vector<std::string>& languages) {
    g_language_override = languages;
}

std::vector<std::string> get_languages() {
    if (!g_language_override.empty()) {
        return g_language_override;
    }

    if (fs::exists(LINGUAS_FILE)) {
        auto languages = read_word_list(LINGUAS_FILE);
        if (!languages.empty()) {
            return languages;
        }
        log_warning(string_format("warning.linguas_empty", LINGUAS_FILE.string()));
    }
    return DEFAULT_LANGUAGES;
}

fs::path catalog_path(const std::string& language) {
    if (language.empty() || language.find('/') != std::string::npos || language == "." || language == "..") {
        throw PofillException(string_format("error.invalid_language", language));
    }
    return PO_DIR / (language + "." + CATALOG_EXTENSION);
}
