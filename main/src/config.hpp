#pragma once

#include <string>
#include <vector>
#include <filesystem>

// Global variables for paths (initially set to defaults, but can be modified)
extern std::filesystem::path PO_DIR;
extern std::filesystem::path TABLE_DIR;
extern std::filesystem::path L10N_DIR;
extern std::string CATALOG_EXTENSION;

// Derived paths
extern std::filesystem::path LINGUAS_FILE;

// Languages processed when neither the command line nor LINGUAS names any
extern const std::vector<std::string> DEFAULT_LANGUAGES;

// Functions
void set_po_dir(const std::string& po_dir);
void set_table_dir(const std::string& table_dir);
void set_l10n_dir(const std::string& l10n_dir);
void set_catalog_extension(const std::string& extension);
void set_languages(const std::vector<std::string>& languages); // Manually override language list
std::vector<std::string> get_languages();
std::filesystem::path catalog_path(const std::string& language);
