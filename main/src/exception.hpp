#pragma once

#include <stdexcept>
#include <string>

class PofillException : public std::runtime_error {
public:
    explicit PofillException(const std::string& message)
        : std::runtime_error(message) {}
};
