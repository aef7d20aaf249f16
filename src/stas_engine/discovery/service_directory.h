#ifndef STAS_SERVICE_DIRECTORY_H
#define STAS_SERVICE_DIRECTORY_H

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "service_discovery_source.h"
#include "../transport/transport_id.h"

namespace nvmestas {
namespace engine {

/**
 * @brief Current set of service announcements, keyed by announcement id.
 * @details Owned by the dispatcher loop. Source callbacks post their updates to it.
 */
class ServiceDirectory {
public:
    ServiceDirectory() = default;

    /** @brief Returns true when the announcement is new or changed. */
    bool upsert(const ServiceAnnouncement& announcement);

    /** @brief Returns true when the id was known. */
    bool remove(const std::string& id);

    void clear();
    size_t size() const;

    std::vector<ServiceAnnouncement> all_announcements() const;

    /** @brief Candidate discovery controller TIDs for every usable announcement. */
    std::vector<TransportId> discovery_controllers() const;

    /**
     * @brief Converts one announcement into a DC TID.
     * @details Transport from the "p" TXT key (default tcp), trsvcid from the port,
     *          subsysnqn from the "nqn" TXT key or the well-known discovery NQN, and
     *          the receiving interface as host-iface.
     */
    static std::optional<TransportId> to_transport_id(const ServiceAnnouncement& announcement);

private:
    std::map<std::string, ServiceAnnouncement> announcements_;
};

} // namespace engine
} // namespace nvmestas

#endif // STAS_SERVICE_DIRECTORY_H
