#include "service_directory.h"

#include <tuple>

#include "../utils/ip_utils.h"
#include "../utils/stas_logger.h"
#include "../utils/string_utils.h"

namespace nvmestas {
namespace engine {

namespace {

bool same_announcement(const ServiceAnnouncement& a, const ServiceAnnouncement& b) {
    return std::tie(a.interface, a.address, a.port, a.txt) == std::tie(b.interface, b.address, b.port, b.txt);
}

std::string txt_value(const ServiceAnnouncement& announcement, const char* key) {
    auto it = announcement.txt.find(key);
    return it == announcement.txt.end() ? std::string() : utils::trim_copy(it->second);
}

} // namespace

bool ServiceDirectory::upsert(const ServiceAnnouncement& announcement) {
    auto it = announcements_.find(announcement.id);
    if (it != announcements_.end() && same_announcement(it->second, announcement)) {
        return false;
    }
    announcements_[announcement.id] = announcement;
    return true;
}

bool ServiceDirectory::remove(const std::string& id) {
    return announcements_.erase(id) > 0;
}

void ServiceDirectory::clear() {
    announcements_.clear();
}

size_t ServiceDirectory::size() const {
    return announcements_.size();
}

std::vector<ServiceAnnouncement> ServiceDirectory::all_announcements() const {
    std::vector<ServiceAnnouncement> result;
    result.reserve(announcements_.size());
    for (const auto& kv : announcements_) {
        result.push_back(kv.second);
    }
    return result;
}

std::optional<TransportId> ServiceDirectory::to_transport_id(const ServiceAnnouncement& announcement) {
    if (announcement.address.empty() || announcement.port <= 0) {
        return std::nullopt;
    }
    TidFields fields;
    const std::string transport = utils::lowercase_copy(txt_value(announcement, "p"));
    fields["transport"] = transport.empty() ? "tcp" : transport;
    fields["traddr"] = utils::strip_ipv6_scope(announcement.address);
    fields["trsvcid"] = std::to_string(announcement.port);
    const std::string nqn = txt_value(announcement, "nqn");
    fields["subsysnqn"] = nqn.empty() ? kWellKnownDiscoveryNqn : nqn;
    fields["host-iface"] = announcement.interface;

    std::string error;
    auto tid = parse_transport_id(fields, &error);
    if (!tid) {
        LOG_STAS_WARNING("Ignoring announcement %s: %s", announcement.id.c_str(), error.c_str());
        return std::nullopt;
    }
    return tid->with_kind(ControllerKind::Discovery);
}

std::vector<TransportId> ServiceDirectory::discovery_controllers() const {
    std::vector<TransportId> result;
    for (const auto& announcement : all_announcements()) {
        auto tid = to_transport_id(announcement);
        if (!tid) {
            continue;
        }
        bool duplicate = false;
        for (const auto& known : result) {
            if (TransportId::matches(known, *tid)) {
                duplicate = true;
                break;
            }
        }
        if (!duplicate) {
            result.push_back(*tid);
        }
    }
    return result;
}

} // namespace engine
} // namespace nvmestas
