/**
 * @file desired_state.h
 * @brief Builds the set of controllers the engine wants connected.
 * @details The set is always rebuilt from its inputs (configuration, mDNS, log page
 *          caches) and never patched in place:
 *          desired = (manual ∪ discovered) − excluded − unusable addresses.
 *          Entries that match() one already in the set are dropped, the first one wins,
 *          so manual entries take precedence over discovered ones.
 */
#ifndef STAS_DESIRED_STATE_H
#define STAS_DESIRED_STATE_H

#include <optional>
#include <string>
#include <vector>

#include "configuration/stas_config_types.h"
#include "../transport/discovery_log_entry.h"
#include "../transport/transport_id.h"

namespace nvmestas {
namespace engine {

struct DesiredEntry {
    TransportId tid;
    TidFields overrides;                      // per-controller connection settings from config
    std::optional<DiscoveryLogEntry> dlpe;    // the log page entry that described it, if any
};

using DesiredStateSet = std::vector<DesiredEntry>;

struct DesiredStateOptions {
    bool ipv4_enabled = true;
    bool ipv6_enabled = true;
    bool ignore_iface = false;

    static DesiredStateOptions from_config(const config::StasConfig& config);
};

DesiredStateSet build_desired_state(const std::vector<DesiredEntry>& manual,
                                    const std::vector<DesiredEntry>& discovered,
                                    const std::vector<TidFields>& excludes,
                                    const DesiredStateOptions& options);

/**
 * @brief True when one exclude entry has all of its keys equal to the TID's fields.
 * @details host-traddr is not considered, an exclude entry naming only host-traddr
 *          therefore never matches.
 */
bool is_excluded(const TransportId& tid, const std::vector<TidFields>& excludes);

/**
 * @brief tcp and rdma need a literal IP address of an enabled family. fc and loop
 *        addresses are accepted as is. Anything else is unusable.
 */
bool has_usable_address(const TransportId& tid, bool ipv4_enabled, bool ipv6_enabled);

/** @brief [Controllers] controller= entries of one kind (Discovery or Io). Bad entries are logged and skipped. */
std::vector<DesiredEntry> configured_entries(const config::StasConfig& config, ControllerKind kind);

/** @brief I/O subsystem entries (subtype nvme) of a DC's cache, reached through the DC's host path. */
std::vector<DesiredEntry> io_entries_from_cache(const TransportId& dc, const std::vector<DiscoveryLogEntry>& cache);

/** @brief Referral entries of a DC's cache as DC candidates. */
std::vector<DesiredEntry> referral_entries_from_cache(const TransportId& dc, const std::vector<DiscoveryLogEntry>& cache);

} // namespace engine
} // namespace nvmestas

#endif // STAS_DESIRED_STATE_H
