#include "ip_utils.h"

#include <arpa/inet.h>
#include <netinet/in.h>

namespace nvmestas {
namespace engine {
namespace utils {

std::string strip_ipv6_scope(const std::string& address) {
    const auto pos = address.find('%');
    return pos == std::string::npos ? address : address.substr(0, pos);
}

int ip_version(const std::string& address) {
    if (address.empty()) {
        return 0;
    }
    struct in_addr addr4;
    if (inet_pton(AF_INET, address.c_str(), &addr4) == 1) {
        return 4;
    }
    struct in6_addr addr6;
    if (inet_pton(AF_INET6, strip_ipv6_scope(address).c_str(), &addr6) == 1) {
        return 6;
    }
    return 0;
}

bool is_ipv6_link_local(const std::string& address) {
    struct in6_addr addr6;
    if (inet_pton(AF_INET6, strip_ipv6_scope(address).c_str(), &addr6) != 1) {
        return false;
    }
    return addr6.s6_addr[0] == 0xfe && (addr6.s6_addr[1] & 0xc0) == 0x80;
}

} // namespace utils
} // namespace engine
} // namespace nvmestas
