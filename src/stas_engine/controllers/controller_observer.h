#ifndef STAS_CONTROLLER_OBSERVER_H
#define STAS_CONTROLLER_OBSERVER_H

#include <vector>

#include "../transport/discovery_log_entry.h"
#include "../transport/transport_id.h"

namespace nvmestas {
namespace engine {

class Controller;
class DiscoveryController;
enum class ControllerState;

/**
 * @brief Receives controller notifications on the dispatcher thread.
 * @details Implementations must not destroy the notifying controller from inside
 *          controller_state_changed() or the log page callbacks. controller_disposed()
 *          is delivered as a separate dispatcher task, so the owner may drop its
 *          reference there.
 */
class ControllerObserver {
public:
    virtual ~ControllerObserver() = default;

    virtual void controller_state_changed(Controller& controller, ControllerState from, ControllerState to) {
        (void)controller;
        (void)from;
        (void)to;
    }

    /** @brief The controller finished its removal and reached IDLE for good. */
    virtual void controller_disposed(const TransportId& tid) = 0;

    /** @brief A discovery controller replaced its log page cache and the content changed. */
    virtual void log_pages_changed(DiscoveryController& dc,
                                   const std::vector<DiscoveryLogEntry>& added,
                                   const std::vector<DiscoveryLogEntry>& removed) {
        (void)dc;
        (void)added;
        (void)removed;
    }

    /** @brief The referral entries of a discovery controller changed. */
    virtual void referrals_changed(DiscoveryController& dc) { (void)dc; }
};

} // namespace engine
} // namespace nvmestas

#endif // STAS_CONTROLLER_OBSERVER_H
