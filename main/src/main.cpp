#include "catalog_processor.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "translation_table.hpp"
#include "utils.hpp"
#include "cxxopts.hpp"

#include <iostream>
#include <string>
#include <vector>

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
    std::cerr << get_string("info.commands") << std::endl;
    std::cerr << get_string("info.fill_desc") << std::endl;
    std::cerr << get_string("info.stats_desc") << std::endl;
}

std::vector<std::string> resolve_languages(const cxxopts::ParseResult& result) {
    if (result.count("languages-list")) {
        return result["languages-list"].as<std::vector<std::string>>();
    }
    if (result.count("languages")) {
        auto languages = split_list(result["languages"].as<std::string>());
        if (languages.empty()) {
            throw PofillException(get_string("error.empty_language_list"));
        }
        return languages;
    }
    return {};
}

int main(int argc, char* argv[]) {
    try {
        init_localization();

        cxxopts::Options options(argv[0]);
        options.custom_help(get_string("info.usage"));
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("info.help_desc"))
            ("d,po-dir", get_string("help.po_dir"), cxxopts::value<std::string>()->default_value("po"))
            ("t,table-dir", get_string("help.table_dir"), cxxopts::value<std::string>())
            ("l,languages", get_string("help.languages"), cxxopts::value<std::string>())
            ("extension", get_string("help.extension"), cxxopts::value<std::string>()->default_value("po"))
            ("n,dry-run", get_string("help.dry_run"), cxxopts::value<bool>()->default_value("false"))
            ("v,verbose", get_string("help.verbose"), cxxopts::value<bool>()->default_value("false"))
            ("q,quiet", get_string("help.quiet"), cxxopts::value<bool>()->default_value("false"))
            ("command", "", cxxopts::value<std::string>())
            ("languages-list", "", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command", "languages-list"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        if (result["verbose"].as<bool>() && result["quiet"].as<bool>()) {
            throw PofillException(get_string("error.verbose_quiet_conflict"));
        }
        if (result["verbose"].as<bool>()) {
            set_verbosity(Verbosity::VERBOSE);
        } else if (result["quiet"].as<bool>()) {
            set_verbosity(Verbosity::QUIET);
        }

        set_dry_run_mode(result["dry-run"].as<bool>());
        set_po_dir(result["po-dir"].as<std::string>());
        set_catalog_extension(result["extension"].as<std::string>());
        if (result.count("table-dir")) {
            set_table_dir(result["table-dir"].as<std::string>());
        }

        if (!result.count("command")) {
            print_usage(options);
            return 1;
        }

        const std::string& command = result["command"].as<std::string>();
        if (command != "fill" && command != "stats") {
            print_usage(options);
            return 1;
        }

        set_languages(resolve_languages(result));
        const auto languages = get_languages();

        log_debug(string_format("debug.loading_table", TABLE_DIR.string()));
        const TranslationTable table = TranslationTable::load_from_dir(TABLE_DIR);

        if (command == "fill") {
            FillReport report = fill_catalogs(languages, table);
            if (report.has_failures()) {
                return 1;
            }
        } else {
            StatsReport report = collect_stats(languages, table);
            if (report.failed > 0) {
                return 1;
            }
        }

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const PofillException& e) {
        log_error(string_format("error.pofill_error", e.what()));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }

    return 0;
}
