/**
 * @file kernel_inventory.h
 * @brief Point-in-time enumeration of the nvme controllers known to the kernel.
 */
#ifndef STAS_KERNEL_INVENTORY_H
#define STAS_KERNEL_INVENTORY_H

#include <string>
#include <vector>

#include "../transport/transport_id.h"

namespace nvmestas {
namespace engine {

struct KernelConnectionEntry {
    std::string device;      // "nvme3"
    TidFields fields;        // transport, traddr, trsvcid, subsysnqn, host-*
    std::string cntrltype;   // "discovery", "io" or empty on older kernels
    bool has_children = false;

    /** @brief Same rules the kernel and the discovery service use to tell a DC apart. */
    bool looks_like_discovery_controller() const;
};

using KernelConnectionSnapshot = std::vector<KernelConnectionEntry>;

class KernelInventory {
public:
    virtual ~KernelInventory() = default;

    /** @brief Fresh enumeration. Never cached by callers across audit passes. */
    virtual KernelConnectionSnapshot snapshot() = 0;
};

} // namespace engine
} // namespace nvmestas

#endif // STAS_KERNEL_INVENTORY_H
