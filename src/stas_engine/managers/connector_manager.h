/**
 * @file connector_manager.h
 * @brief Owns the fleet of I/O controllers.
 * @details Desired IOCs = configured I/O controllers ∪ the "nvme" entries of every
 *          discovery controller's log page cache, minus excluded entries and unusable
 *          addresses. Discovered entries inherit host-traddr and host-iface from the DC
 *          that reported them.
 */
#ifndef STAS_CONNECTOR_MANAGER_H
#define STAS_CONNECTOR_MANAGER_H

#include <map>
#include <memory>
#include <vector>

#include "finder_manager.h"
#include "../controllers/controller_observer.h"
#include "../controllers/io_controller.h"
#include "../kernel/kernel_inventory.h"
#include "../reconciler/reconciler.h"

namespace nvmestas {
namespace engine {

/** @brief Lets the kernel finish populating sysfs attributes after an "add" event. */
inline constexpr std::chrono::milliseconds kKernelAddSoakPeriod{1000};

class ConnectorManager : public ControllerObserver {
public:
    ConnectorManager(ControllerContext& context, KernelInventory& inventory, LogPagesSource& log_pages);
    ~ConnectorManager() override;

    ConnectorManager(const ConnectorManager&) = delete;
    ConnectorManager& operator=(const ConnectorManager&) = delete;

    void start();

    /** @brief Releases every IOC. Connections to I/O controllers always survive the daemon. */
    void shutdown();

    void schedule_audit();
    void schedule_audit(Clock::duration soak);
    void audit_now();

    void reload();

    /**
     * @brief Routes a kernel event to the IOC owning the device.
     * @details "add" and "remove" events also schedule an audit, so connections made or
     *          dropped behind the daemon's back are picked up.
     */
    void on_device_event(const DeviceEvent& event);

    void on_log_pages_changed(const TransportId& dc);
    void on_dc_removed(const TransportId& dc);

    std::vector<std::shared_ptr<IoController>> controllers() const;
    std::shared_ptr<IoController> find(const TransportId& tid) const;
    size_t size() const { return controllers_.size(); }

    const Reconciler& reconciler() const { return reconciler_; }
    size_t audits_completed() const { return audits_completed_; }

    void controller_disposed(const TransportId& tid) override;

private:
    void apply_audit(const KernelConnectionSnapshot& snapshot);
    DesiredStateSet compute_desired_state() const;
    std::shared_ptr<IoController> create_controller(const DesiredEntry& entry, bool owned);
    void dispose_external(const RemoveAction& action);
    void push_log_page_entries(const DesiredStateSet& desired);

    ControllerContext& context_;
    KernelInventory& inventory_;
    LogPagesSource& log_pages_;

    std::map<TransportId, std::shared_ptr<IoController>> controllers_;
    Reconciler reconciler_;
    RestartableTimer soak_timer_;

    bool audit_in_flight_ = false;
    bool audit_again_ = false;
    bool stopping_ = false;
    size_t audits_completed_ = 0;
};

} // namespace engine
} // namespace nvmestas

#endif // STAS_CONNECTOR_MANAGER_H
