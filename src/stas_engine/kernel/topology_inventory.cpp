#include "topology_inventory.h"

#include <algorithm>

#include "../utils/stas_logger.h"

namespace nvmestas {
namespace engine {

namespace {

std::string text(const char* value) {
    return value ? std::string(value) : std::string();
}

void set_field(TidFields& fields, const char* key, const std::string& value) {
    if (!value.empty()) {
        fields[key] = value;
    }
}

} // namespace

bool KernelConnectionEntry::looks_like_discovery_controller() const {
    auto it = fields.find("subsysnqn");
    if (it != fields.end() && it->second == kWellKnownDiscoveryNqn) {
        return true;
    }
    if (!cntrltype.empty()) {
        return cntrltype == "discovery";
    }
    return !has_children;
}

nvme_ctrl_t find_controller(nvme_root_t root, const std::string& device) {
    nvme_host_t host;
    nvme_subsystem_t subsystem;
    nvme_ctrl_t ctrl;
    nvme_for_each_host(root, host) {
        nvme_for_each_subsystem(host, subsystem) {
            nvme_subsystem_for_each_ctrl(subsystem, ctrl) {
                if (device == text(nvme_ctrl_get_name(ctrl))) {
                    return ctrl;
                }
            }
        }
    }
    return nullptr;
}

ControllerAttributes read_controller_attributes(nvme_host_t host, nvme_ctrl_t ctrl) {
    ControllerAttributes attributes;
    attributes.name = text(nvme_ctrl_get_name(ctrl));
    attributes.transport = text(nvme_ctrl_get_transport(ctrl));
    attributes.traddr = text(nvme_ctrl_get_traddr(ctrl));
    attributes.trsvcid = text(nvme_ctrl_get_trsvcid(ctrl));
    attributes.subsysnqn = text(nvme_ctrl_get_subsysnqn(ctrl));
    attributes.host_traddr = text(nvme_ctrl_get_host_traddr(ctrl));
    attributes.host_iface = text(nvme_ctrl_get_host_iface(ctrl));
    attributes.host_nqn = text(nvme_host_get_hostnqn(host));
    attributes.host_id = text(nvme_host_get_hostid(host));
    attributes.cntrltype = text(nvme_ctrl_get_cntrltype(ctrl));
    // Namespaces, or paths with native multipath, only hang off I/O controllers.
    attributes.has_children = nvme_ctrl_first_ns(ctrl) != nullptr || nvme_ctrl_first_path(ctrl) != nullptr;
    return attributes;
}

KernelConnectionEntry make_kernel_entry(const ControllerAttributes& attributes) {
    KernelConnectionEntry entry;
    entry.device = attributes.name;
    set_field(entry.fields, "transport", attributes.transport);
    set_field(entry.fields, "traddr", attributes.traddr);
    set_field(entry.fields, "trsvcid", attributes.trsvcid);
    set_field(entry.fields, "subsysnqn", attributes.subsysnqn);
    set_field(entry.fields, "host-traddr", attributes.host_traddr);
    set_field(entry.fields, "host-iface", attributes.host_iface);
    set_field(entry.fields, "host-nqn", attributes.host_nqn);
    set_field(entry.fields, "host-id", attributes.host_id);
    entry.cntrltype = attributes.cntrltype;
    entry.has_children = attributes.has_children;
    return entry;
}

KernelConnectionSnapshot TopologyInventory::snapshot() {
    KernelConnectionSnapshot result;
    ScopedNvmeRoot root;
    if (!root) {
        LOG_STAS_DEBUG("Cannot scan the nvme topology, the nvme driver is probably not loaded.");
        return result;
    }

    nvme_host_t host;
    nvme_subsystem_t subsystem;
    nvme_ctrl_t ctrl;
    nvme_for_each_host(root.get(), host) {
        nvme_for_each_subsystem(host, subsystem) {
            nvme_subsystem_for_each_ctrl(subsystem, ctrl) {
                ControllerAttributes attributes = read_controller_attributes(host, ctrl);
                if (attributes.name.empty() || attributes.transport.empty()) {
                    continue;
                }
                result.push_back(make_kernel_entry(attributes));
            }
        }
    }
    std::sort(result.begin(), result.end(), [](const KernelConnectionEntry& a, const KernelConnectionEntry& b) {
        return a.device < b.device;
    });
    return result;
}

} // namespace engine
} // namespace nvmestas
