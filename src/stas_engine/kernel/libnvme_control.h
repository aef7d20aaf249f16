/**
 * @file libnvme_control.h
 * @brief NvmeControl implementation over libnvme.
 * @details Every call scans a fresh topology tree and frees it before returning, so
 *          no libnvme handle outlives the worker job that used it.
 * - connect: nvme_create_ctrl() + nvmf_add_ctrl()
 * - disconnect: nvme_disconnect_ctrl()
 * - get_log_page: nvmf_get_discovery_wargs(), with the PLEO bit when the DC supports it
 * - register_host: nvmf_register_ctrl() (TP8010)
 */
#ifndef STAS_LIBNVME_CONTROL_H
#define STAS_LIBNVME_CONTROL_H

#include <libnvme.h>

#include <string>
#include <vector>

#include "nvme_control.h"
#include "topology_inventory.h"

namespace nvmestas {
namespace engine {

class LibnvmeControl : public NvmeControl {
public:
    LibnvmeControl() = default;

    std::optional<std::string> find_existing(const TransportId& tid) override;
    ConnectResult connect(const TransportId& tid,
                          const config::ConnectionParams& params,
                          const HostIdentity& host) override;
    OpStatus disconnect(const std::string& device) override;
    LogPageResult get_log_page(const std::string& device, bool port_local_only) override;
    OpStatus register_host(const std::string& device, const HostIdentity& host) override;

    /** @brief Fabrics options for nvmf_add_ctrl(), starting from libnvme's defaults. */
    static struct nvme_fabrics_config fabrics_config(const config::ConnectionParams& params);

private:
    TopologyInventory inventory_;
};

/** @brief Converts one raw log page record. Multi-byte fields are little-endian. */
DiscoveryLogEntry to_discovery_log_entry(const struct nvmf_disc_log_entry& raw);

/** @brief Every record of a log page returned by nvmf_get_discovery_wargs(). */
std::vector<DiscoveryLogEntry> discovery_log_entries(const struct nvmf_discovery_log& log);

} // namespace engine
} // namespace nvmestas

#endif // STAS_LIBNVME_CONTROL_H
