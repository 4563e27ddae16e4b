#pragma once

#include "exception.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_CYAN = "\033[1;36m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions
void log_info(std::string_view msg);
void log_debug(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);

// Output verbosity
enum class Verbosity {
    QUIET,
    NORMAL,
    VERBOSE
};

void set_verbosity(Verbosity level);
Verbosity get_verbosity();

void set_dry_run_mode(bool enable);
bool get_dry_run_mode();

// Filesystem utilities
std::string read_text_file(const fs::path& path);
void write_text_file(const fs::path& path, const std::string& content);
void replace_file(const fs::path& from, const fs::path& to);
std::vector<std::string> read_word_list(const fs::path& path);

// String utilities
std::vector<std::string> split_list(std::string_view text);
