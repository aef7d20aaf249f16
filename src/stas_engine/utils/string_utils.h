#ifndef STAS_STRING_UTILS_H
#define STAS_STRING_UTILS_H

#include <optional>
#include <string>
#include <vector>

namespace nvmestas {
namespace engine {
namespace utils {

std::string trim_copy(const std::string& input);
std::string lowercase_copy(std::string text);
void lowercase_in_place(std::string& text);

/** @brief Splits on `delimiter`, trims every piece and drops the empty ones. */
std::vector<std::string> split_trimmed(const std::string& text, char delimiter);

bool starts_with(const std::string& text, const std::string& prefix);

/** @brief Parses a base-10 integer; the whole string must be consumed. */
std::optional<long> parse_long(const std::string& text);

/** @brief Accepts true/false, yes/no, on/off, enabled/disabled and 1/0 (case-insensitive). */
std::optional<bool> parse_bool(const std::string& text);

/** @brief Parses a hexadecimal value with or without a leading "0x". */
std::optional<unsigned long> parse_hex(const std::string& text);

} // namespace utils
} // namespace engine
} // namespace nvmestas

#endif // STAS_STRING_UTILS_H
