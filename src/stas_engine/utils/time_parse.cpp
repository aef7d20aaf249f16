#include "time_parse.h"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <vector>

#include "string_utils.h"

namespace nvmestas {
namespace engine {
namespace utils {

namespace {

bool all_digits(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    for (unsigned char c : text) {
        if (!std::isdigit(c)) {
            return false;
        }
    }
    return true;
}

long unit_multiplier(const std::string& unit) {
    if (unit == "d" || unit == "dy" || unit == "dys" || unit == "day" || unit == "days") {
        return 86400;
    }
    if (unit == "h" || unit == "hr" || unit == "hrs" || unit == "hour" || unit == "hours") {
        return 3600;
    }
    if (unit == "m" || unit == "min" || unit == "mins" || unit == "minute" || unit == "minutes") {
        return 60;
    }
    if (unit == "s" || unit == "sec" || unit == "secs" || unit == "second" || unit == "seconds") {
        return 1;
    }
    return 0;
}

std::optional<double> parse_clock(const std::string& text) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    for (;;) {
        const auto colon = text.find(':', start);
        parts.push_back(text.substr(start, colon == std::string::npos ? std::string::npos : colon - start));
        if (colon == std::string::npos) {
            break;
        }
        start = colon + 1;
    }

    static const long kMultipliers2[] = {60, 1};
    static const long kMultipliers3[] = {3600, 60, 1};
    static const long kMultipliers4[] = {86400, 3600, 60, 1};
    const long* multipliers = nullptr;
    switch (parts.size()) {
        case 2: multipliers = kMultipliers2; break;
        case 3: multipliers = kMultipliers3; break;
        case 4: multipliers = kMultipliers4; break;
        default: return std::nullopt;
    }

    double total = 0.0;
    for (size_t i = 0; i < parts.size(); ++i) {
        const std::string& part = parts[i];
        if (i == 0 && part.empty() && parts.size() == 2) {
            continue; // ":22"
        }
        if (!all_digits(part)) {
            return std::nullopt;
        }
        // Every field after the first is exactly two digits.
        if (i > 0 && part.size() != 2) {
            return std::nullopt;
        }
        total += static_cast<double>(std::strtol(part.c_str(), nullptr, 10)) * static_cast<double>(multipliers[i]);
    }
    return total;
}

std::optional<double> parse_units(const std::string& text) {
    double total = 0.0;
    bool matched_any = false;
    size_t pos = 0;
    const size_t len = text.size();

    while (pos < len) {
        while (pos < len && (std::isspace(static_cast<unsigned char>(text[pos])) || text[pos] == ',' || text[pos] == '/')) {
            ++pos;
        }
        if (pos >= len) {
            break;
        }

        const size_t number_start = pos;
        while (pos < len && (std::isdigit(static_cast<unsigned char>(text[pos])) || text[pos] == '.')) {
            ++pos;
        }
        if (pos == number_start) {
            return std::nullopt;
        }
        char* end_ptr = nullptr;
        const std::string number_text = text.substr(number_start, pos - number_start);
        const double number = std::strtod(number_text.c_str(), &end_ptr);
        if (*end_ptr != '\0') {
            return std::nullopt;
        }

        while (pos < len && std::isspace(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        const size_t unit_start = pos;
        while (pos < len && std::isalpha(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        const long multiplier = unit_multiplier(lowercase_copy(text.substr(unit_start, pos - unit_start)));
        if (multiplier == 0) {
            return std::nullopt;
        }
        total += number * static_cast<double>(multiplier);
        matched_any = true;
    }

    if (!matched_any) {
        return std::nullopt;
    }
    return total;
}

} // namespace

std::optional<std::chrono::seconds> parse_duration(const std::string& text) {
    std::string value = trim_copy(text);
    if (value.empty()) {
        return std::nullopt;
    }

    char* end_ptr = nullptr;
    const double plain = std::strtod(value.c_str(), &end_ptr);
    if (*end_ptr == '\0') {
        if (!std::isfinite(plain)) {
            return std::nullopt;
        }
        return std::chrono::seconds(static_cast<long>(std::lround(plain)));
    }

    double sign = 1.0;
    if (value[0] == '+' || value[0] == '-') {
        sign = value[0] == '-' ? -1.0 : 1.0;
        value = trim_copy(value.substr(1));
    }

    std::optional<double> seconds;
    if (value.find(':') != std::string::npos) {
        seconds = parse_clock(value);
    } else {
        seconds = parse_units(value);
    }
    if (!seconds) {
        return std::nullopt;
    }
    return std::chrono::seconds(static_cast<long>(std::lround(sign * *seconds)));
}

} // namespace utils
} // namespace engine
} // namespace nvmestas
