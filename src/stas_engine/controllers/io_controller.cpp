#include "io_controller.h"

#include "../utils/stas_logger.h"

namespace nvmestas {
namespace engine {

IoController::IoController(ControllerContext& context,
                           TransportId tid,
                           config::ConnectionParams params,
                           ControllerObserver* observer)
    : Controller(context, tid.with_kind(ControllerKind::Io), std::move(params), observer) {}

void IoController::update_dlpe(const DiscoveryLogEntry& entry) {
    const bool changed = !dlpe_ || *dlpe_ != entry;
    const bool ncc_cleared = dlpe_ && dlpe_->ncc() && !entry.ncc();
    dlpe_ = entry;

    if (!changed) {
        return;
    }
    if (state() == ControllerState::Suspended) {
        LOG_STAS_INFO("%s | Log page entry changed (NCC %s), resuming connection attempts.",
                      tid().to_string().c_str(),
                      entry.ncc() ? "set" : "clear");
        resume();
    } else if (ncc_cleared && state() == ControllerState::RetryWait) {
        LOG_STAS_INFO("%s | NCC cleared, reconnecting now.", tid().to_string().c_str());
        resume();
    }
}

bool IoController::should_suspend() const {
    const int limit = context().config.ioc_management.effective_connect_attempts_on_ncc();
    return limit > 0 && ncc() && connect_attempts() >= limit;
}

ControllerInfo IoController::info() const {
    ControllerInfo result = Controller::info();
    result["ncc"] = ncc() ? "true" : "false";
    return result;
}

} // namespace engine
} // namespace nvmestas
