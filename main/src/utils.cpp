#include "utils.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <mutex>
#include <sstream>

namespace fs = std::filesystem;

namespace {
    Verbosity verbosity = Verbosity::NORMAL;
    bool dry_run_mode = false;
    std::mutex log_mutex;
    bool is_stdout_tty = false;
    bool is_stderr_tty = false;
    bool tty_check_performed = false;

    // Helper function to reduce code duplication in logging
    void log_internal(std::string_view prefix, std::string_view color, std::string_view msg, std::ostream& stream) {
        std::lock_guard<std::mutex> lock(log_mutex);

        if (!tty_check_performed) {
            is_stdout_tty = isatty(STDOUT_FILENO);
            is_stderr_tty = isatty(STDERR_FILENO);
            tty_check_performed = true;
        }

        bool current_stream_is_tty = false;
        if (&stream == &std::cout) {
            current_stream_is_tty = is_stdout_tty;
        } else if (&stream == &std::cerr) {
            current_stream_is_tty = is_stderr_tty;
        }

        if (current_stream_is_tty) {
            stream << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
        } else {
            stream << prefix << msg << std::endl;
        }
    }
}

void log_info(std::string_view msg) {
    if (verbosity == Verbosity::QUIET) return;
    log_internal(get_string("info.log_prefix"), COLOR_GREEN, msg, std::cout);
}

void log_debug(std::string_view msg) {
    if (verbosity != Verbosity::VERBOSE) return;
    log_internal(get_string("debug.log_prefix"), COLOR_CYAN, msg, std::cout);
}

void log_warning(std::string_view msg) {
    log_internal(get_string("warning.prefix") + " ", COLOR_YELLOW, msg, std::cerr);
}

void log_error(std::string_view msg) {
    log_internal(get_string("error.prefix") + " ", COLOR_RED, msg, std::cerr);
}

void set_verbosity(Verbosity level) {
    verbosity = level;
}

Verbosity get_verbosity() {
    return verbosity;
}

void set_dry_run_mode(bool enable) {
    dry_run_mode = enable;
}

bool get_dry_run_mode() {
    return dry_run_mode;
}

std::string read_text_file(const fs::path& path) {
    if (fs::is_directory(path)) {
        throw PofillException(string_format("error.read_file_failed", path.string()));
    }
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw PofillException(string_format("error.open_file_failed", path.string()) + ": " + strerror(errno));
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw PofillException(string_format("error.read_file_failed", path.string()));
    }
    return content;
}

void write_text_file(const fs::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw PofillException(string_format("error.create_file_failed", path.string()) + ": " + strerror(errno));
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.flush();
    if (!file) {
        throw PofillException(string_format("error.write_file_failed", path.string()));
    }
}

void replace_file(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) {
        throw PofillException(string_format("error.rename_failed", from.string(), to.string()) + ": " + ec.message());
    }
}

std::vector<std::string> read_word_list(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw PofillException(string_format("error.open_file_failed", path.string()));
    }
    std::vector<std::string> result;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        auto hash_pos = line.find('#');
        if (hash_pos != std::string::npos) {
            line.erase(hash_pos);
        }
        std::istringstream iss(line);
        std::string word;
        while (iss >> word) {
            result.push_back(word);
        }
    }
    return result;
}

std::vector<std::string> split_list(std::string_view text) {
    std::vector<std::string> result;
    std::string current;
    for (char c : text) {
        if (c == ',' || c == ' ' || c == '\t') {
            if (!current.empty()) {
                result.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        result.push_back(current);
    }
    return result;
}
