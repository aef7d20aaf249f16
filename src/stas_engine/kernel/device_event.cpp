#include "device_event.h"

#include <cstring>

#include "../utils/string_utils.h"

namespace nvmestas {
namespace engine {

std::optional<uint32_t> DeviceEvent::aen() const {
    auto it = properties.find("NVME_AEN");
    if (it == properties.end()) {
        return std::nullopt;
    }
    auto value = utils::parse_hex(it->second);
    if (!value || *value > 0xffffffffUL) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(*value);
}

std::string DeviceEvent::nvme_event() const {
    return property("NVME_EVENT");
}

std::string DeviceEvent::property(const std::string& key) const {
    auto it = properties.find(key);
    return it == properties.end() ? std::string() : it->second;
}

std::optional<DeviceEvent> parse_uevent(const char* data, std::size_t size) {
    if (data == nullptr || size == 0) {
        return std::nullopt;
    }

    // libudev re-broadcasts carry a binary header starting with "libudev"; only
    // raw kernel messages are consumed.
    const char* end = data + size;
    const char* cursor = data;
    const size_t header_len = strnlen(cursor, static_cast<size_t>(end - cursor));
    std::string header(cursor, header_len);
    const auto at = header.find('@');
    if (at == std::string::npos) {
        return std::nullopt;
    }

    DeviceEvent event;
    event.action = header.substr(0, at);
    const std::string devpath = header.substr(at + 1);
    cursor += header_len + 1;

    while (cursor < end) {
        const size_t len = strnlen(cursor, static_cast<size_t>(end - cursor));
        std::string pair(cursor, len);
        cursor += len + 1;
        const auto eq = pair.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        event.properties[pair.substr(0, eq)] = pair.substr(eq + 1);
    }

    if (event.property("SUBSYSTEM") != "nvme") {
        return std::nullopt;
    }

    event.device = event.property("DEVNAME");
    if (event.device.empty()) {
        const auto slash = devpath.find_last_of('/');
        event.device = slash == std::string::npos ? devpath : devpath.substr(slash + 1);
    } else if (utils::starts_with(event.device, "/dev/")) {
        event.device = event.device.substr(5);
    }
    if (event.device.empty()) {
        return std::nullopt;
    }
    return event;
}

} // namespace engine
} // namespace nvmestas
