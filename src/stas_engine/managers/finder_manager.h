/**
 * @file finder_manager.h
 * @brief Owns the fleet of discovery controllers.
 * @details Desired DCs = configured ∪ mDNS-announced ∪ referrals ∪ DCs previously
 *        discovered through mDNS that are still responsive, minus excluded entries and
 *        unusable addresses. Changes are soaked before the audit runs so that a burst of
 *        events leads to a single pass. mDNS DCs are not dropped when they momentarily
 *        disappear from mDNS. They are dropped when excluded or after failing to connect
 *        for longer than zeroconf-connections-persistence.
 */
#ifndef STAS_FINDER_MANAGER_H
#define STAS_FINDER_MANAGER_H

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "../controllers/controller_observer.h"
#include "../controllers/discovery_controller.h"
#include "../discovery/service_directory.h"
#include "../kernel/kernel_inventory.h"
#include "../persistence/last_known_config.h"
#include "../reconciler/reconciler.h"

namespace nvmestas {
namespace engine {

inline constexpr std::chrono::milliseconds kConfigSoakPeriod{1500};
inline constexpr std::chrono::seconds kUnresponsiveCheckPeriod{60};

struct DiscoveredLogPages {
    TransportId dc;
    std::string device;
    bool provisional = false;
    std::vector<DiscoveryLogEntry> entries;
};

/** @brief Read side of the DC caches, as consumed by the connector. */
class LogPagesSource {
public:
    virtual ~LogPagesSource() = default;
    virtual std::vector<DiscoveredLogPages> all_log_pages() const = 0;
};

class FinderManager : public ControllerObserver, public LogPagesSource {
public:
    using LogPagesCallback = std::function<void(const TransportId& dc, const std::string& device)>;
    using DcRemovedCallback = std::function<void(const TransportId& dc)>;

    FinderManager(ControllerContext& context,
                  KernelInventory& inventory,
                  ServiceDirectory& directory,
                  LastKnownConfig* store);
    ~FinderManager() override;

    FinderManager(const FinderManager&) = delete;
    FinderManager& operator=(const FinderManager&) = delete;

    /** @brief Recreates DCs from the last known configuration, then audits. */
    void start();

    /**
     * @brief Disposes of every DC. Connections are kept when persistent-connections
     *        is set, which is the default.
     */
    void shutdown();

    /** @brief Restarts the soak timer. The audit runs when it expires. */
    void schedule_audit();

    /** @brief Takes a fresh kernel snapshot on the executor and reconciles. */
    void audit_now();

    /** @brief Configuration was reloaded. */
    void reload();

    void on_device_event(const DeviceEvent& event);

    /** @brief The service directory changed. */
    void on_services_changed();

    std::vector<std::shared_ptr<DiscoveryController>> controllers() const;
    std::shared_ptr<DiscoveryController> find(const TransportId& tid) const;
    size_t size() const { return controllers_.size(); }

    std::vector<DiscoveredLogPages> all_log_pages() const override;

    void add_log_pages_listener(LogPagesCallback callback);
    void add_dc_removed_listener(DcRemovedCallback callback);

    const Reconciler& reconciler() const { return reconciler_; }
    size_t audits_completed() const { return audits_completed_; }

    // ControllerObserver
    void controller_disposed(const TransportId& tid) override;
    void log_pages_changed(DiscoveryController& dc,
                           const std::vector<DiscoveryLogEntry>& added,
                           const std::vector<DiscoveryLogEntry>& removed) override;
    void referrals_changed(DiscoveryController& dc) override;

private:
    void recover_from_store();
    DesiredStateSet compute_desired_state(std::vector<DesiredEntry>& configured,
                                          std::vector<DesiredEntry>& announced) const;
    void apply_audit(const KernelConnectionSnapshot& snapshot);
    std::shared_ptr<DiscoveryController> create_controller(const DesiredEntry& entry, DcOrigin origin);
    DcOrigin origin_for(const TransportId& tid,
                        const std::vector<DesiredEntry>& configured,
                        const std::vector<DesiredEntry>& announced) const;
    config::ConnectionParams params_for(const TransportId& tid) const;
    bool is_unresponsive(const DiscoveryController& dc) const;
    void check_unresponsive();

    ControllerContext& context_;
    KernelInventory& inventory_;
    ServiceDirectory& directory_;
    LastKnownConfig* store_;

    std::map<TransportId, std::shared_ptr<DiscoveryController>> controllers_;
    Reconciler reconciler_;
    RestartableTimer soak_timer_;
    RestartableTimer unresponsive_timer_;

    std::vector<LogPagesCallback> log_pages_listeners_;
    std::vector<DcRemovedCallback> dc_removed_listeners_;

    bool audit_in_flight_ = false;
    bool audit_again_ = false;
    bool stopping_ = false;
    size_t audits_completed_ = 0;
};

} // namespace engine
} // namespace nvmestas

#endif // STAS_FINDER_MANAGER_H
