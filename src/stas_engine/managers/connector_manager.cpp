#include "connector_manager.h"

#include "configuration/config_loader.h"
#include "../dispatcher/worker_pool.h"
#include "../utils/stas_logger.h"

namespace nvmestas {
namespace engine {

ConnectorManager::ConnectorManager(ControllerContext& context, KernelInventory& inventory, LogPagesSource& log_pages)
    : context_(context),
      inventory_(inventory),
      log_pages_(log_pages),
      reconciler_(ControllerKind::Io, ReconcilePolicy::from_config(context.config.ioc_management)),
      soak_timer_(context.dispatcher, kConfigSoakPeriod, [this]() { audit_now(); }) {}

ConnectorManager::~ConnectorManager() {
    soak_timer_.stop();
}

void ConnectorManager::start() {
    stopping_ = false;
    LOG_STAS_INFO("[Connector] Starting (disconnect scope: %s).",
                  config::to_string(context_.config.ioc_management.disconnect_scope));
    schedule_audit();
}

void ConnectorManager::shutdown() {
    stopping_ = true;
    soak_timer_.stop();
    LOG_STAS_INFO("[Connector] Releasing %zu I/O controllers.", controllers_.size());
    for (const auto& ioc : controllers()) {
        ioc->remove(true);
    }
}

void ConnectorManager::schedule_audit() {
    schedule_audit(kConfigSoakPeriod);
}

void ConnectorManager::schedule_audit(Clock::duration soak) {
    if (stopping_) {
        return;
    }
    // A running soak is never shortened, a burst of events ends in one audit.
    if (soak_timer_.is_running() && soak_timer_.time_remaining() > soak) {
        return;
    }
    soak_timer_.start(soak);
}

void ConnectorManager::audit_now() {
    if (stopping_) {
        return;
    }
    soak_timer_.stop();
    if (audit_in_flight_) {
        audit_again_ = true;
        return;
    }
    audit_in_flight_ = true;
    KernelInventory& inventory = inventory_;
    bool queued = run_blocking<KernelConnectionSnapshot>(
        context_.executor,
        context_.dispatcher,
        [&inventory]() { return inventory.snapshot(); },
        [this](KernelConnectionSnapshot snapshot) {
            audit_in_flight_ = false;
            if (stopping_) {
                return;
            }
            apply_audit(snapshot);
            if (audit_again_) {
                audit_again_ = false;
                audit_now();
            }
        });
    if (!queued) {
        audit_in_flight_ = false;
        LOG_STAS_WARNING("[Connector] Worker pool unavailable, audit skipped.");
    }
}

DesiredStateSet ConnectorManager::compute_desired_state() const {
    const config::StasConfig& config = context_.config;
    const auto configured = configured_entries(config, ControllerKind::Io);

    std::vector<DesiredEntry> discovered;
    for (const auto& pages : log_pages_.all_log_pages()) {
        for (auto& entry : io_entries_from_cache(pages.dc, pages.entries)) {
            discovered.push_back(std::move(entry));
        }
    }
    return build_desired_state(configured, discovered, config.excludes, DesiredStateOptions::from_config(config));
}

std::shared_ptr<IoController> ConnectorManager::create_controller(const DesiredEntry& entry, bool owned) {
    auto params = config::resolve_connection_params(context_.config.global, entry.overrides, false);
    auto ioc = std::make_shared<IoController>(context_, entry.tid, params, this);
    ioc->set_owned(owned);
    if (entry.dlpe) {
        ioc->update_dlpe(*entry.dlpe);
    }
    controllers_[entry.tid] = ioc;
    return ioc;
}

void ConnectorManager::dispose_external(const RemoveAction& action) {
    LOG_STAS_INFO("[Connector] %s - Disconnecting unmanaged connection %s.",
                  action.device.c_str(),
                  action.tid.to_string().c_str());
    // No controller here: a stray connection that vanished since the snapshot must
    // not be reconnected just to be torn down again.
    NvmeControl& nvme = context_.nvme;
    const std::string device = action.device;
    const TransportId tid = action.tid;
    bool queued = run_blocking<OpStatus>(
        context_.executor,
        context_.dispatcher,
        [&nvme, device]() { return nvme.disconnect(device); },
        [this, tid, device](OpStatus status) {
            if (!status.ok()) {
                LOG_STAS_WARNING("[Connector] %s - Failed to disconnect: %s", device.c_str(), status.message.c_str());
            }
            reconciler_.forget(tid);
        });
    if (!queued) {
        LOG_STAS_WARNING("[Connector] %s - Worker pool unavailable, disconnect skipped.", device.c_str());
        reconciler_.forget(tid);
    }
}

void ConnectorManager::apply_audit(const KernelConnectionSnapshot& snapshot) {
    const DesiredStateSet desired = compute_desired_state();
    ReconcileActions actions = reconciler_.audit(desired, snapshot);

    for (const auto& create : actions.to_create) {
        if (create.adopt) {
            LOG_STAS_INFO("[Connector] %s - Adopting %s.", create.device.c_str(), create.entry.tid.to_string().c_str());
        } else {
            LOG_STAS_INFO("[Connector] Adding %s.", create.entry.tid.to_string().c_str());
        }
        auto ioc = create_controller(create.entry, !create.adopt);
        ioc->start();
    }

    for (const auto& remove : actions.to_remove) {
        if (!remove.managed) {
            dispose_external(remove);
            continue;
        }
        auto it = controllers_.find(remove.tid);
        if (it == controllers_.end()) {
            continue;
        }
        LOG_STAS_INFO("[Connector] Removing %s.", remove.tid.to_string().c_str());
        auto ioc = it->second;
        ioc->remove(false);
    }

    for (const auto& release : actions.to_release) {
        auto it = controllers_.find(release.tid);
        if (it == controllers_.end()) {
            continue;
        }
        LOG_STAS_INFO("[Connector] Releasing %s, connection left in place.", release.tid.to_string().c_str());
        auto ioc = it->second;
        ioc->remove(true);
    }

    push_log_page_entries(desired);
    ++audits_completed_;
}

void ConnectorManager::push_log_page_entries(const DesiredStateSet& desired) {
    for (const auto& entry : desired) {
        if (!entry.dlpe) {
            continue;
        }
        auto ioc = find(entry.tid);
        if (ioc && !ioc->removal_requested()) {
            ioc->update_dlpe(*entry.dlpe);
        }
    }
}

void ConnectorManager::reload() {
    reconciler_.set_policy(ReconcilePolicy::from_config(context_.config.ioc_management));
    const auto configured = configured_entries(context_.config, ControllerKind::Io);
    for (const auto& kv : controllers_) {
        TidFields overrides;
        for (const auto& entry : configured) {
            if (TransportId::matches(entry.tid, kv.first)) {
                overrides = entry.overrides;
                break;
            }
        }
        kv.second->set_connection_params(
            config::resolve_connection_params(context_.config.global, overrides, false));
    }
    schedule_audit();
}

void ConnectorManager::on_device_event(const DeviceEvent& event) {
    for (const auto& ioc : controllers()) {
        ioc->on_device_event(event);
    }
    if (event.is_add()) {
        schedule_audit(kKernelAddSoakPeriod);
    } else if (event.is_remove()) {
        schedule_audit();
    }
}

void ConnectorManager::on_log_pages_changed(const TransportId& dc) {
    LOG_STAS_DEBUG("[Connector] Log pages of %s changed.", dc.to_string().c_str());
    schedule_audit();
}

void ConnectorManager::on_dc_removed(const TransportId& dc) {
    LOG_STAS_DEBUG("[Connector] %s went away.", dc.to_string().c_str());
    schedule_audit();
}

std::vector<std::shared_ptr<IoController>> ConnectorManager::controllers() const {
    std::vector<std::shared_ptr<IoController>> result;
    result.reserve(controllers_.size());
    for (const auto& kv : controllers_) {
        result.push_back(kv.second);
    }
    return result;
}

std::shared_ptr<IoController> ConnectorManager::find(const TransportId& tid) const {
    auto it = controllers_.find(tid);
    if (it != controllers_.end()) {
        return it->second;
    }
    for (const auto& kv : controllers_) {
        if (TransportId::matches(kv.first, tid)) {
            return kv.second;
        }
    }
    return nullptr;
}

void ConnectorManager::controller_disposed(const TransportId& tid) {
    auto it = controllers_.find(tid);
    if (it == controllers_.end()) {
        return;
    }
    controllers_.erase(it);
    reconciler_.forget(tid);
    LOG_STAS_DEBUG("[Connector] %s disposed of.", tid.to_string().c_str());
    // The entry may have come back while it was being torn down.
    schedule_audit();
}

} // namespace engine
} // namespace nvmestas
