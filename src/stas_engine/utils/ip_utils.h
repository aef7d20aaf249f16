#ifndef STAS_IP_UTILS_H
#define STAS_IP_UTILS_H

#include <string>

namespace nvmestas {
namespace engine {
namespace utils {

/** @brief IP version of a textual address: 4, 6, or 0 when the text is not an address. */
int ip_version(const std::string& address);

/**
 * @brief True for an IPv6 link-local address (fe80::/10).
 * @details A "%scope" suffix is accepted and ignored.
 */
bool is_ipv6_link_local(const std::string& address);

/** @brief Strips a trailing "%scope" from an IPv6 address. */
std::string strip_ipv6_scope(const std::string& address);

} // namespace utils
} // namespace engine
} // namespace nvmestas

#endif // STAS_IP_UTILS_H
