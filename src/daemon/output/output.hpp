#pragma once

#include <expected>
#include <string>

// Delivers transcribed text to the focused application.
class OutputMethod {
public:
    virtual ~OutputMethod() = default;
    virtual std::expected<void, std::string> deliver(const std::string& text) = 0;
    virtual std::string name() const = 0;
};
