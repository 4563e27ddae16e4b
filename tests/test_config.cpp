#include <gtest/gtest.h>
#include "../main/src/config.hpp"
#include "../main/src/exception.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_root;

    void SetUp() override {
        // Reset to default
        set_po_dir("po");
        set_table_dir("");
        set_catalog_extension("po");
        set_languages({});

        test_root = fs::absolute("tmp_config_test");
        if (fs::exists(test_root)) fs::remove_all(test_root);
        fs::create_directories(test_root);
    }

    void TearDown() override {
        set_po_dir("po");
        set_table_dir("");
        set_catalog_extension("po");
        set_languages({});
        if (fs::exists(test_root)) fs::remove_all(test_root);
    }
};

TEST_F(ConfigTest, DefaultPaths) {
    EXPECT_EQ(PO_DIR, fs::path("po"));
    EXPECT_EQ(TABLE_DIR, fs::path("po") / "table");
    EXPECT_EQ(LINGUAS_FILE, fs::path("po") / "LINGUAS");
    EXPECT_EQ(CATALOG_EXTENSION, "po");
}

TEST_F(ConfigTest, PoDirRebasesDerivedPaths) {
    set_po_dir("/srv/app/po/");

    EXPECT_EQ(PO_DIR, fs::path("/srv/app/po/"));
    EXPECT_EQ(TABLE_DIR, fs::path("/srv/app/po/") / "table");
    EXPECT_EQ(LINGUAS_FILE, fs::path("/srv/app/po/") / "LINGUAS");
    EXPECT_EQ(catalog_path("uk"), fs::path("/srv/app/po/") / "uk.po");
}

TEST_F(ConfigTest, ExplicitTableDirSurvivesPoDirChange) {
    set_table_dir("/etc/pofill/tables");
    set_po_dir("/srv/app/po");

    EXPECT_EQ(TABLE_DIR, fs::path("/etc/pofill/tables"));

    set_table_dir("");
    EXPECT_EQ(TABLE_DIR, fs::path("/srv/app/po") / "table");
}

TEST_F(ConfigTest, CatalogExtension) {
    set_catalog_extension(".pot");
    EXPECT_EQ(CATALOG_EXTENSION, "pot");
    EXPECT_EQ(catalog_path("de"), fs::path("po") / "de.pot");

    EXPECT_THROW(set_catalog_extension("."), PofillException);
    EXPECT_EQ(CATALOG_EXTENSION, "pot");
}

TEST_F(ConfigTest, InvalidLanguageCodes) {
    EXPECT_THROW(catalog_path(""), PofillException);
    EXPECT_THROW(catalog_path("../etc/passwd"), PofillException);
    EXPECT_THROW(catalog_path(".."), PofillException);
    EXPECT_NO_THROW(catalog_path("pt_BR"));
    EXPECT_NO_THROW(catalog_path("sr@latin"));
}

TEST_F(ConfigTest, DefaultLanguageList) {
    set_po_dir(test_root.string());

    auto languages = get_languages();
    ASSERT_EQ(languages.size(), 15u);
    EXPECT_EQ(languages.front(), "uk");
    EXPECT_EQ(languages.back(), "uz");
}

TEST_F(ConfigTest, LinguasFile) {
    set_po_dir(test_root.string());
    {
        std::ofstream f(test_root / "LINGUAS");
        f << "# Supported languages\n";
        f << "de fr\n";
        f << "pt_BR  # Brazil\r\n";
        f << "\n";
    }

    std::vector<std::string> expected = {"de", "fr", "pt_BR"};
    EXPECT_EQ(get_languages(), expected);
}

TEST_F(ConfigTest, EmptyLinguasFallsBackToDefaults) {
    set_po_dir(test_root.string());
    {
        std::ofstream f(test_root / "LINGUAS");
        f << "# nothing yet\n";
    }

    EXPECT_EQ(get_languages(), DEFAULT_LANGUAGES);
}

TEST_F(ConfigTest, ExplicitLanguagesWin) {
    set_po_dir(test_root.string());
    {
        std::ofstream f(test_root / "LINGUAS");
        f << "de fr\n";
    }
    set_languages({"uk"});

    std::vector<std::string> expected = {"uk"};
    EXPECT_EQ(get_languages(), expected);
}
