#include "desired_state.h"

#include "../utils/ip_utils.h"
#include "../utils/stas_logger.h"
#include "../utils/string_utils.h"

namespace nvmestas {
namespace engine {

namespace {

bool already_present(const DesiredStateSet& set, const TransportId& tid) {
    for (const auto& entry : set) {
        if (TransportId::matches(entry.tid, tid)) {
            return true;
        }
    }
    return false;
}

bool exclude_matches(const TidFields& exclude, const TidFields& candidate) {
    bool compared_any = false;
    for (const auto& kv : exclude) {
        if (kv.first == "host-traddr") {
            continue;
        }
        auto it = candidate.find(kv.first);
        if (it == candidate.end()) {
            return false;
        }
        const bool equal = kv.first == "transport" ? utils::lowercase_copy(kv.second) == it->second
                                                   : kv.second == it->second;
        if (!equal) {
            return false;
        }
        compared_any = true;
    }
    return compared_any;
}

} // namespace

DesiredStateOptions DesiredStateOptions::from_config(const config::StasConfig& config) {
    DesiredStateOptions options;
    options.ipv4_enabled = config.global.ipv4_enabled;
    options.ipv6_enabled = config.global.ipv6_enabled;
    options.ignore_iface = config.global.ignore_iface;
    return options;
}

bool is_excluded(const TransportId& tid, const std::vector<TidFields>& excludes) {
    if (excludes.empty()) {
        return false;
    }
    const TidFields candidate = tid.as_fields();
    for (const auto& exclude : excludes) {
        if (exclude_matches(exclude, candidate)) {
            return true;
        }
    }
    return false;
}

bool has_usable_address(const TransportId& tid, bool ipv4_enabled, bool ipv6_enabled) {
    if (tid.transport() == "fc" || tid.transport() == "loop") {
        return true;
    }
    if (tid.transport() != "tcp" && tid.transport() != "rdma") {
        return false;
    }
    switch (utils::ip_version(tid.traddr())) {
        case 4: return ipv4_enabled;
        case 6: return ipv6_enabled;
        default: return false;
    }
}

DesiredStateSet build_desired_state(const std::vector<DesiredEntry>& manual,
                                    const std::vector<DesiredEntry>& discovered,
                                    const std::vector<TidFields>& excludes,
                                    const DesiredStateOptions& options) {
    DesiredStateSet result;
    auto consider = [&](const DesiredEntry& input) {
        DesiredEntry entry = input;
        if (options.ignore_iface) {
            entry.tid = entry.tid.without_host_iface();
        }
        if (is_excluded(entry.tid, excludes)) {
            LOG_STAS_DEBUG("%s excluded by configuration.", entry.tid.to_string().c_str());
            return;
        }
        if (!has_usable_address(entry.tid, options.ipv4_enabled, options.ipv6_enabled)) {
            LOG_STAS_DEBUG("%s has no usable address.", entry.tid.to_string().c_str());
            return;
        }
        if (already_present(result, entry.tid)) {
            return;
        }
        result.push_back(std::move(entry));
    };

    for (const auto& entry : manual) {
        consider(entry);
    }
    for (const auto& entry : discovered) {
        consider(entry);
    }
    return result;
}

std::vector<DesiredEntry> configured_entries(const config::StasConfig& config, ControllerKind kind) {
    std::vector<DesiredEntry> result;
    for (const auto& fields : config.controllers) {
        auto subsysnqn = fields.find("subsysnqn");
        const bool is_dc = subsysnqn == fields.end() || subsysnqn->second.empty() ||
                           subsysnqn->second == kWellKnownDiscoveryNqn;
        if (is_dc != (kind == ControllerKind::Discovery)) {
            continue;
        }

        TidFields tid_fields = fields;
        if (is_dc) {
            tid_fields["subsysnqn"] = kWellKnownDiscoveryNqn;
        }
        std::string error;
        auto tid = parse_transport_id(tid_fields, &error);
        if (!tid) {
            LOG_STAS_WARNING("Ignoring controller entry: %s", error.c_str());
            continue;
        }
        DesiredEntry entry;
        entry.tid = tid->with_kind(kind);
        entry.overrides = fields;
        result.push_back(std::move(entry));
    }
    return result;
}

std::vector<DesiredEntry> io_entries_from_cache(const TransportId& dc, const std::vector<DiscoveryLogEntry>& cache) {
    std::vector<DesiredEntry> result;
    for (const auto& dlpe : cache) {
        if (!dlpe.is_io_subsystem() || !dlpe.has_valid_address()) {
            continue;
        }
        auto tid = dlpe.to_transport_id(dc.host_traddr(), dc.host_iface());
        if (!tid) {
            LOG_STAS_DEBUG("%s | Skipping unusable log page entry for %s.", dc.to_string().c_str(), dlpe.traddr.c_str());
            continue;
        }
        DesiredEntry entry;
        entry.tid = *tid;
        entry.dlpe = dlpe;
        result.push_back(std::move(entry));
    }
    return result;
}

std::vector<DesiredEntry> referral_entries_from_cache(const TransportId& dc, const std::vector<DiscoveryLogEntry>& cache) {
    std::vector<DesiredEntry> result;
    for (const auto& dlpe : cache) {
        if (!dlpe.is_referral() || !dlpe.has_valid_address()) {
            continue;
        }
        auto tid = dlpe.to_transport_id(dc.host_traddr(), dc.host_iface());
        if (!tid) {
            continue;
        }
        DesiredEntry entry;
        entry.tid = *tid;
        entry.dlpe = dlpe;
        result.push_back(std::move(entry));
    }
    return result;
}

} // namespace engine
} // namespace nvmestas
