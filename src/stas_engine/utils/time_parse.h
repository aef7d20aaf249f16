#ifndef STAS_TIME_PARSE_H
#define STAS_TIME_PARSE_H

#include <chrono>
#include <optional>
#include <string>

namespace nvmestas {
namespace engine {
namespace utils {

/**
 * @brief Parses a human readable duration into whole seconds.
 * @details Accepted forms:
 *          - bare numbers: "90", "-1"
 *          - unit sequences: "72hours", "1d 2h", "1 minute, 24 secs", "1m24s"
 *          - clock forms: "1:24" (m:ss), "1:30:00" (h:mm:ss), "2:01:30:00" (d:hh:mm:ss), ":22"
 *          A leading sign applies to the whole expression.
 * @return std::nullopt when the text is not a duration.
 */
std::optional<std::chrono::seconds> parse_duration(const std::string& text);

} // namespace utils
} // namespace engine
} // namespace nvmestas

#endif // STAS_TIME_PARSE_H
