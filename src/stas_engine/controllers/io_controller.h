#ifndef STAS_IO_CONTROLLER_H
#define STAS_IO_CONTROLLER_H

#include <optional>

#include "controller.h"
#include "../transport/discovery_log_entry.h"

namespace nvmestas {
namespace engine {

/**
 * @brief Controller for one I/O subsystem.
 * @details Remembers the log page entry that described it so that the "Not Connected
 *          to CDC" flag can stop pointless reconnect attempts (see
 *          connect-attempts-on-ncc). Configured controllers have no entry.
 */
class IoController : public Controller {
public:
    IoController(ControllerContext& context,
                 TransportId tid,
                 config::ConnectionParams params,
                 ControllerObserver* observer);

    /**
     * @brief Latest log page entry for this controller.
     * @details A SUSPENDED controller resumes when NCC is cleared or the entry changed.
     *          A controller waiting to retry reconnects right away when NCC is cleared.
     */
    void update_dlpe(const DiscoveryLogEntry& entry);

    const std::optional<DiscoveryLogEntry>& dlpe() const { return dlpe_; }
    bool ncc() const { return dlpe_ && dlpe_->ncc(); }

    ControllerInfo info() const override;

protected:
    bool should_suspend() const override;

private:
    std::optional<DiscoveryLogEntry> dlpe_;
};

} // namespace engine
} // namespace nvmestas

#endif // STAS_IO_CONTROLLER_H
