/**
 * @file topology_inventory.h
 * @brief KernelInventory backed by the libnvme topology scan (host / subsystem / controller).
 */
#ifndef STAS_TOPOLOGY_INVENTORY_H
#define STAS_TOPOLOGY_INVENTORY_H

#include <libnvme.h>

#include <string>

#include "kernel_inventory.h"

namespace nvmestas {
namespace engine {

/** @brief Owns a libnvme tree. Every controller handle taken from it dies with it. */
class ScopedNvmeRoot {
public:
    /** @brief Scans the topology. get() is null when that failed. */
    ScopedNvmeRoot() : root_(nvme_scan(nullptr)) {}
    ~ScopedNvmeRoot() {
        if (root_) {
            nvme_free_tree(root_);
        }
    }

    ScopedNvmeRoot(const ScopedNvmeRoot&) = delete;
    ScopedNvmeRoot& operator=(const ScopedNvmeRoot&) = delete;

    nvme_root_t get() const { return root_; }
    explicit operator bool() const { return root_ != nullptr; }

private:
    nvme_root_t root_;
};

/** @brief Controller named `device` ("nvme3") in the tree, or null. */
nvme_ctrl_t find_controller(nvme_root_t root, const std::string& device);

/** @brief Attribute values of one controller. Missing attributes read as empty. */
struct ControllerAttributes {
    std::string name;
    std::string transport;
    std::string traddr;
    std::string trsvcid;
    std::string subsysnqn;
    std::string host_traddr;
    std::string host_iface;
    std::string host_nqn;
    std::string host_id;
    std::string cntrltype;
    bool has_children = false;
};

ControllerAttributes read_controller_attributes(nvme_host_t host, nvme_ctrl_t ctrl);

/** @brief Inventory record with the TID spelling of every non-empty attribute. */
KernelConnectionEntry make_kernel_entry(const ControllerAttributes& attributes);

class TopologyInventory : public KernelInventory {
public:
    TopologyInventory() = default;

    /** @brief Sorted by device name. Empty when the nvme driver is not loaded. */
    KernelConnectionSnapshot snapshot() override;
};

} // namespace engine
} // namespace nvmestas

#endif // STAS_TOPOLOGY_INVENTORY_H
