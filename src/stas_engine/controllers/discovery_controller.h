/**
 * @file discovery_controller.h
 * @brief Discovery controller: a Controller that keeps the DC's Discovery Log Page cache.
 * @details Once connected, the DC optionally registers the host (TP8010, only when a
 *          host symbolic name is configured) and then retrieves the log page. The cache
 *          is only ever replaced by a successful retrieval. Retrieval failures retry on
 *          a timer without leaving CONNECTED, so dependents never see an empty cache
 *          because of a refresh.
 */
#ifndef STAS_DISCOVERY_CONTROLLER_H
#define STAS_DISCOVERY_CONTROLLER_H

#include <vector>

#include "controller.h"
#include "../persistence/last_known_config.h"
#include "../transport/discovery_log_entry.h"

namespace nvmestas {
namespace engine {

enum class DcOrigin {
    Configured,
    Discovered,   // mDNS
    Referral
};

const char* to_string(DcOrigin origin);
DcOrigin parse_dc_origin(const std::string& text);

inline constexpr std::chrono::seconds kLogPageRetryPeriod{20};
inline constexpr std::chrono::seconds kRegistrationRetryPeriod{5};

class DiscoveryController : public Controller {
public:
    DiscoveryController(ControllerContext& context,
                        TransportId tid,
                        config::ConnectionParams params,
                        ControllerObserver* observer,
                        DcOrigin origin,
                        LastKnownConfig* store);
    ~DiscoveryController() override;

    /** @brief Seeds the cache from persistent storage. Replaced by the first live page. */
    void set_provisional_cache(std::vector<DiscoveryLogEntry> entries);

    const std::vector<DiscoveryLogEntry>& cache() const { return cache_; }
    bool provisional() const { return provisional_; }
    bool registered() const { return registered_; }

    DcOrigin origin() const { return origin_; }
    void set_origin(DcOrigin origin) { origin_ = origin; }

    /** @brief Referral entries of the current cache. */
    std::vector<DiscoveryLogEntry> referrals() const;

    /** @brief Re-reads the log page now. Coalesced with a running operation. */
    void request_log_page();

    /** @brief Writes the cache and origin to the store on the worker pool. */
    void persist_cache();

    /** @brief Drops the persisted copy (the DC left the desired state). */
    void forget_persisted_cache();

    ControllerInfo info() const override;

protected:
    void on_connected() override;
    void on_connection_lost() override;
    void on_aen(uint32_t aen) override;
    void on_nvme_event(const std::string& event) override;

private:
    void request_registration();
    void handle_registration(OpStatus status);
    void handle_log_page(LogPageResult result);
    void replace_cache(std::vector<DiscoveryLogEntry> entries);
    void run_pending_requests();
    void start_store_write(bool remove);
    void store_write_done();

    DcOrigin origin_;
    LastKnownConfig* store_;
    std::vector<DiscoveryLogEntry> cache_;
    bool provisional_ = false;
    bool registered_ = false;
    bool refresh_requested_ = false;
    bool registration_requested_ = false;
    // Store writes run one at a time so that a save never lands after a remove.
    bool store_write_in_flight_ = false;
    bool store_save_pending_ = false;
    bool store_remove_pending_ = false;
    RestartableTimer log_page_timer_;
    RestartableTimer registration_timer_;
};

} // namespace engine
} // namespace nvmestas

#endif // STAS_DISCOVERY_CONTROLLER_H
