#ifndef STAS_DEVICE_EVENT_H
#define STAS_DEVICE_EVENT_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace nvmestas {
namespace engine {

/**
 * @brief A kernel uevent for an nvme device ("add", "remove" or "change").
 */
struct DeviceEvent {
    std::string action;
    std::string device;   // "nvme3"
    std::map<std::string, std::string> properties;

    bool is_add() const { return action == "add"; }
    bool is_remove() const { return action == "remove"; }
    bool is_change() const { return action == "change"; }

    /** @brief Value of NVME_AEN, the asynchronous event the controller reported. */
    std::optional<uint32_t> aen() const;

    /** @brief Value of NVME_EVENT ("connected", "rediscover"), empty when absent. */
    std::string nvme_event() const;

    std::string property(const std::string& key) const;
};

/**
 * @brief Parses a NETLINK_KOBJECT_UEVENT datagram.
 * @details The payload is "action@devpath" followed by NUL separated KEY=VALUE pairs.
 *          The device name is taken from DEVNAME, or from the last devpath component.
 * @return std::nullopt for malformed messages and for subsystems other than nvme.
 */
std::optional<DeviceEvent> parse_uevent(const char* data, std::size_t size);

} // namespace engine
} // namespace nvmestas

#endif // STAS_DEVICE_EVENT_H
