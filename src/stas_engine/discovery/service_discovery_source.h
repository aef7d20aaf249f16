/**
 * @file service_discovery_source.h
 * @brief Interface to a source of discovery controller announcements (mDNS, DNS-SD).
 */
#ifndef STAS_SERVICE_DISCOVERY_SOURCE_H
#define STAS_SERVICE_DISCOVERY_SOURCE_H

#include <functional>
#include <map>
#include <string>

namespace nvmestas {
namespace engine {

/** @brief One resolved _nvme-disc._tcp service. */
struct ServiceAnnouncement {
    std::string id;          // stable key chosen by the source (interface/protocol/name/type/domain)
    std::string interface;   // receiving interface, e.g. "eth0"
    std::string address;     // resolved address
    int port = 0;
    std::map<std::string, std::string> txt;   // TXT record, keys lower-cased
};

class ServiceDiscoverySource {
public:
    using AddedCallback = std::function<void(const ServiceAnnouncement&)>;
    using RemovedCallback = std::function<void(const std::string& id)>;

    virtual ~ServiceDiscoverySource() = default;

    /**
     * @brief Starts browsing. Callbacks may run on any thread.
     * @return false when the source is unavailable (the engine then runs without it).
     */
    virtual bool start(AddedCallback on_added, RemovedCallback on_removed) = 0;
    virtual void stop() = 0;
};

} // namespace engine
} // namespace nvmestas

#endif // STAS_SERVICE_DISCOVERY_SOURCE_H
