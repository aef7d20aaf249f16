#include "discovery_log_entry.h"

#include <tuple>

namespace nvmestas {
namespace engine {

bool DiscoveryLogEntry::has_valid_address() const {
    return !(traddr.empty() || traddr == "0.0.0.0" || traddr == "::");
}

std::optional<TransportId> DiscoveryLogEntry::to_transport_id(const std::string& host_traddr, const std::string& host_iface) const {
    TidFields fields;
    fields["transport"] = trtype;
    fields["traddr"] = traddr;
    fields["trsvcid"] = trsvcid;
    fields["subsysnqn"] = subnqn;
    fields["host-traddr"] = host_traddr;
    fields["host-iface"] = host_iface;
    auto tid = parse_transport_id(fields);
    if (!tid) {
        return std::nullopt;
    }
    return tid->with_kind(describes_discovery_controller() ? ControllerKind::Discovery : ControllerKind::Io);
}

TidFields DiscoveryLogEntry::as_fields() const {
    TidFields fields;
    fields["trtype"] = trtype;
    fields["adrfam"] = adrfam;
    fields["subtype"] = subtype;
    fields["treq"] = treq;
    fields["portid"] = std::to_string(portid);
    fields["cntlid"] = std::to_string(cntlid);
    fields["asqsz"] = std::to_string(asqsz);
    fields["eflags"] = std::to_string(eflags);
    fields["trsvcid"] = trsvcid;
    fields["subnqn"] = subnqn;
    fields["traddr"] = traddr;
    return fields;
}

bool DiscoveryLogEntry::operator==(const DiscoveryLogEntry& other) const {
    return std::tie(trtype, adrfam, subtype, treq, portid, cntlid, asqsz, eflags, trsvcid, subnqn, traddr) ==
           std::tie(other.trtype, other.adrfam, other.subtype, other.treq, other.portid, other.cntlid,
                    other.asqsz, other.eflags, other.trsvcid, other.subnqn, other.traddr);
}

std::vector<DiscoveryLogEntry> filter_invalid_entries(const std::vector<DiscoveryLogEntry>& entries) {
    std::vector<DiscoveryLogEntry> valid;
    valid.reserve(entries.size());
    for (const auto& entry : entries) {
        if (entry.has_valid_address()) {
            valid.push_back(entry);
        }
    }
    return valid;
}

} // namespace engine
} // namespace nvmestas
