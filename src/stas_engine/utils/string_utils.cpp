#include "string_utils.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace nvmestas {
namespace engine {
namespace utils {

std::string trim_copy(const std::string& input) {
    const auto first = input.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = input.find_last_not_of(" \t\r\n");
    return input.substr(first, last - first + 1);
}

void lowercase_in_place(std::string& text) {
    std::transform(
        text.begin(),
        text.end(),
        text.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
}

std::string lowercase_copy(std::string text) {
    lowercase_in_place(text);
    return text;
}

std::vector<std::string> split_trimmed(const std::string& text, char delimiter) {
    std::vector<std::string> parts;
    std::stringstream ss(text);
    std::string token;
    while (std::getline(ss, token, delimiter)) {
        token = trim_copy(token);
        if (!token.empty()) {
            parts.push_back(token);
        }
    }
    return parts;
}

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

std::optional<long> parse_long(const std::string& text) {
    const std::string trimmed = trim_copy(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    char* end_ptr = nullptr;
    errno = 0;
    const long parsed = std::strtol(trimmed.c_str(), &end_ptr, 10);
    if (errno != 0 || end_ptr == trimmed.c_str() || *end_ptr != '\0') {
        return std::nullopt;
    }
    return parsed;
}

std::optional<bool> parse_bool(const std::string& text) {
    const std::string value = lowercase_copy(trim_copy(text));
    if (value == "true" || value == "yes" || value == "on" || value == "enabled" || value == "1") {
        return true;
    }
    if (value == "false" || value == "no" || value == "off" || value == "disabled" || value == "0") {
        return false;
    }
    return std::nullopt;
}

std::optional<unsigned long> parse_hex(const std::string& text) {
    std::string value = trim_copy(text);
    if (starts_with(value, "0x") || starts_with(value, "0X")) {
        value = value.substr(2);
    }
    if (value.empty()) {
        return std::nullopt;
    }
    char* end_ptr = nullptr;
    errno = 0;
    const unsigned long parsed = std::strtoul(value.c_str(), &end_ptr, 16);
    if (errno != 0 || *end_ptr != '\0') {
        return std::nullopt;
    }
    return parsed;
}

} // namespace utils
} // namespace engine
} // namespace nvmestas
