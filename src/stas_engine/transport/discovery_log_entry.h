/**
 * @file discovery_log_entry.h
 * @brief Discovery Log Page Entry (DLPE) value type.
 */
#ifndef STAS_DISCOVERY_LOG_ENTRY_H
#define STAS_DISCOVERY_LOG_ENTRY_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "transport_id.h"

namespace nvmestas {
namespace engine {

/** @brief AEN value reported by the kernel when a discovery log page changed (LID 0x70, notice 0xf0). */
inline constexpr uint32_t kAenDiscoveryLogChanged = 0x70f002;

/** @brief Entry flag: "Not Connected to CDC". */
inline constexpr uint16_t kEflagsNcc = 1u << 2;

struct DiscoveryLogEntry {
    std::string trtype;   ///< "tcp", "rdma", "fc", "loop"
    std::string adrfam;   ///< "ipv4", "ipv6", "ib", "fc", "loop"
    std::string subtype;  ///< "referral", "nvme" or "discovery"
    std::string treq;     ///< "not specified", "required", "not required"
    uint16_t portid = 0;
    uint16_t cntlid = 0;
    uint16_t asqsz = 0;
    uint16_t eflags = 0;
    std::string trsvcid;
    std::string subnqn;
    std::string traddr;

    bool ncc() const { return (eflags & kEflagsNcc) != 0; }
    bool is_referral() const { return subtype == "referral"; }
    bool is_io_subsystem() const { return subtype == "nvme"; }

    /** @brief Referral and current-discovery entries both point at discovery controllers. */
    bool describes_discovery_controller() const { return subtype == "referral" || subtype == "discovery"; }

    /** @brief False when traddr is 0.0.0.0, :: or empty (placeholders some CDCs report). */
    bool has_valid_address() const;

    /**
     * @brief Candidate TID for the controller this entry describes.
     * @details The host-traddr and host-iface of the discovery controller that reported
     *          the entry are inherited, so the new connection leaves through the same path.
     * @return std::nullopt for entries with an unsupported transport or no address.
     */
    std::optional<TransportId> to_transport_id(const std::string& host_traddr, const std::string& host_iface) const;

    /** @brief Flat key/value view (control surface, debug dumps). */
    TidFields as_fields() const;

    bool operator==(const DiscoveryLogEntry& other) const;
    bool operator!=(const DiscoveryLogEntry& other) const { return !(*this == other); }
};

/** @brief Drops entries whose traddr is 0.0.0.0, :: or empty. */
std::vector<DiscoveryLogEntry> filter_invalid_entries(const std::vector<DiscoveryLogEntry>& entries);

} // namespace engine
} // namespace nvmestas

#endif // STAS_DISCOVERY_LOG_ENTRY_H
