#include "finder_manager.h"

#include "configuration/config_loader.h"
#include "../dispatcher/worker_pool.h"
#include "../utils/stas_logger.h"

namespace nvmestas {
namespace engine {

namespace {

bool contains_match(const std::vector<DesiredEntry>& entries, const TransportId& tid) {
    for (const auto& entry : entries) {
        if (TransportId::matches(entry.tid, tid)) {
            return true;
        }
    }
    return false;
}

const DesiredEntry* find_match(const std::vector<DesiredEntry>& entries, const TransportId& tid) {
    for (const auto& entry : entries) {
        if (TransportId::matches(entry.tid, tid)) {
            return &entry;
        }
    }
    return nullptr;
}

} // namespace

FinderManager::FinderManager(ControllerContext& context,
                             KernelInventory& inventory,
                             ServiceDirectory& directory,
                             LastKnownConfig* store)
    : context_(context),
      inventory_(inventory),
      directory_(directory),
      store_(store),
      reconciler_(ControllerKind::Discovery, ReconcilePolicy{}),
      soak_timer_(context.dispatcher, kConfigSoakPeriod, [this]() { audit_now(); }),
      unresponsive_timer_(context.dispatcher, kUnresponsiveCheckPeriod, [this]() { check_unresponsive(); }) {}

FinderManager::~FinderManager() {
    soak_timer_.stop();
    unresponsive_timer_.stop();
}

void FinderManager::start() {
    stopping_ = false;
    LOG_STAS_INFO("[Finder] Starting.");
    recover_from_store();
    audit_now();
    unresponsive_timer_.start();
}

void FinderManager::recover_from_store() {
    if (!store_) {
        return;
    }
    for (auto& stored : store_->list()) {
        if (controllers_.count(stored.dc) > 0) {
            continue;
        }
        DesiredEntry entry;
        entry.tid = stored.dc.with_kind(ControllerKind::Discovery);
        auto dc = create_controller(entry, parse_dc_origin(stored.origin));
        dc->set_provisional_cache(std::move(stored.entries));
        reconciler_.track(entry.tid, true);
        dc->start();
    }
    if (!controllers_.empty()) {
        LOG_STAS_INFO("[Finder] Recovered %zu discovery controllers from %s.",
                      controllers_.size(),
                      store_->directory().c_str());
    }
}

void FinderManager::shutdown() {
    stopping_ = true;
    soak_timer_.stop();
    unresponsive_timer_.stop();
    const bool keep = context_.config.dc_management.persistent_connections;
    LOG_STAS_INFO("[Finder] Shutting down %zu discovery controllers (%s connections).",
                  controllers_.size(),
                  keep ? "keeping" : "dropping");
    // remove() may post disposals that erase from controllers_, iterate over a copy.
    for (const auto& dc : controllers()) {
        dc->remove(keep);
    }
}

void FinderManager::schedule_audit() {
    if (stopping_) {
        return;
    }
    soak_timer_.start();
}

void FinderManager::audit_now() {
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
        LOG_STAS_WARNING("[Finder] Worker pool unavailable, audit skipped.");
    }
}

DesiredStateSet FinderManager::compute_desired_state(std::vector<DesiredEntry>& configured,
                                                     std::vector<DesiredEntry>& announced) const {
    const config::StasConfig& config = context_.config;
    configured = configured_entries(config, ControllerKind::Discovery);

    announced.clear();
    std::vector<DesiredEntry> discovered;
    if (config.service_discovery.zeroconf_enabled) {
        for (const auto& tid : directory_.discovery_controllers()) {
            DesiredEntry entry;
            entry.tid = tid;
            announced.push_back(entry);
        }
        discovered = announced;

        // DCs found through mDNS stay until they stop answering for too long.
        for (const auto& kv : controllers_) {
            const auto& dc = kv.second;
            if (dc->origin() != DcOrigin::Discovered || dc->removal_requested()) {
                continue;
            }
            if (contains_match(announced, dc->tid()) || is_unresponsive(*dc)) {
                continue;
            }
            DesiredEntry entry;
            entry.tid = kv.first;
            discovered.push_back(entry);
        }
    }

    for (const auto& kv : controllers_) {
        const auto& dc = kv.second;
        if (dc->removal_requested()) {
            continue;
        }
        for (auto& entry : referral_entries_from_cache(dc->tid(), dc->cache())) {
            discovered.push_back(std::move(entry));
        }
    }

    return build_desired_state(configured, discovered, config.excludes, DesiredStateOptions::from_config(config));
}

DcOrigin FinderManager::origin_for(const TransportId& tid,
                                   const std::vector<DesiredEntry>& configured,
                                   const std::vector<DesiredEntry>& announced) const {
    if (contains_match(configured, tid)) {
        return DcOrigin::Configured;
    }
    if (contains_match(announced, tid)) {
        return DcOrigin::Discovered;
    }
    auto it = controllers_.find(tid);
    if (it != controllers_.end() && it->second->origin() == DcOrigin::Discovered) {
        return DcOrigin::Discovered;
    }
    return DcOrigin::Referral;
}

config::ConnectionParams FinderManager::params_for(const TransportId& tid) const {
    TidFields overrides;
    const auto configured = configured_entries(context_.config, ControllerKind::Discovery);
    if (const DesiredEntry* entry = find_match(configured, tid)) {
        overrides = entry->overrides;
    }
    return config::resolve_connection_params(context_.config.global, overrides, true);
}

std::shared_ptr<DiscoveryController> FinderManager::create_controller(const DesiredEntry& entry, DcOrigin origin) {
    auto params = config::resolve_connection_params(context_.config.global, entry.overrides, true);
    auto dc = std::make_shared<DiscoveryController>(context_, entry.tid, params, this, origin, store_);
    // The finder disconnects every DC it lets go, adopted or not.
    dc->set_owned(true);
    controllers_[entry.tid] = dc;
    return dc;
}

void FinderManager::apply_audit(const KernelConnectionSnapshot& snapshot) {
    std::vector<DesiredEntry> configured;
    std::vector<DesiredEntry> announced;
    const DesiredStateSet desired = compute_desired_state(configured, announced);
    ReconcileActions actions = reconciler_.audit(desired, snapshot);

    for (const auto& create : actions.to_create) {
        const DcOrigin origin = origin_for(create.entry.tid, configured, announced);
        const std::string adopting = create.adopt ? " (adopting " + create.device + ")" : std::string();
        LOG_STAS_INFO("[Finder] Adding %s discovery controller %s%s.",
                      to_string(origin),
                      create.entry.tid.to_string().c_str(),
                      adopting.c_str());
        auto dc = create_controller(create.entry, origin);
        reconciler_.track(create.entry.tid, true);
        dc->start();
    }

    for (const auto& remove : actions.to_remove) {
        auto it = controllers_.find(remove.tid);
        if (it == controllers_.end()) {
            continue;
        }
        LOG_STAS_INFO("[Finder] Removing discovery controller %s.", remove.tid.to_string().c_str());
        // Keep a reference, remove() may complete synchronously.
        auto dc = it->second;
        dc->remove(false);
    }

    for (const auto& release : actions.to_release) {
        auto it = controllers_.find(release.tid);
        if (it == controllers_.end()) {
            continue;
        }
        auto dc = it->second;
        dc->remove(true);
    }

    for (const auto& kv : controllers_) {
        const auto& dc = kv.second;
        if (dc->removal_requested()) {
            continue;
        }
        const DcOrigin origin = origin_for(kv.first, configured, announced);
        if (origin == dc->origin()) {
            continue;
        }
        LOG_STAS_DEBUG("[Finder] %s is now %s.", kv.first.to_string().c_str(), to_string(origin));
        dc->set_origin(origin);
        dc->persist_cache();
    }

    ++audits_completed_;
}

bool FinderManager::is_unresponsive(const DiscoveryController& dc) const {
    auto since = dc.failing_since();
    if (!since) {
        return false;
    }
    return context_.dispatcher.clock().now() - *since >= context_.config.dc_management.zeroconf_persistence;
}

void FinderManager::check_unresponsive() {
    bool stale = false;
    for (const auto& kv : controllers_) {
        const auto& dc = kv.second;
        if (dc->origin() == DcOrigin::Discovered && !dc->removal_requested() && is_unresponsive(*dc)) {
            LOG_STAS_INFO("[Finder] %s has not answered for too long.", kv.first.to_string().c_str());
            stale = true;
        }
    }
    if (stale) {
        audit_now();
    }
    if (!stopping_) {
        unresponsive_timer_.start();
    }
}

void FinderManager::reload() {
    for (const auto& kv : controllers_) {
        kv.second->set_connection_params(params_for(kv.first));
    }
    schedule_audit();
}

void FinderManager::on_device_event(const DeviceEvent& event) {
    for (const auto& dc : controllers()) {
        dc->on_device_event(event);
    }
}

void FinderManager::on_services_changed() {
    schedule_audit();
}

std::vector<std::shared_ptr<DiscoveryController>> FinderManager::controllers() const {
    std::vector<std::shared_ptr<DiscoveryController>> result;
    result.reserve(controllers_.size());
    for (const auto& kv : controllers_) {
        result.push_back(kv.second);
    }
    return result;
}

std::shared_ptr<DiscoveryController> FinderManager::find(const TransportId& tid) const {
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

std::vector<DiscoveredLogPages> FinderManager::all_log_pages() const {
    std::vector<DiscoveredLogPages> result;
    for (const auto& kv : controllers_) {
        const auto& dc = kv.second;
        if (dc->removal_requested()) {
            continue;
        }
        DiscoveredLogPages pages;
        pages.dc = dc->tid();
        pages.device = dc->device();
        pages.provisional = dc->provisional();
        pages.entries = dc->cache();
        result.push_back(std::move(pages));
    }
    return result;
}

void FinderManager::add_log_pages_listener(LogPagesCallback callback) {
    log_pages_listeners_.push_back(std::move(callback));
}

void FinderManager::add_dc_removed_listener(DcRemovedCallback callback) {
    dc_removed_listeners_.push_back(std::move(callback));
}

void FinderManager::controller_disposed(const TransportId& tid) {
    auto it = controllers_.find(tid);
    if (it == controllers_.end()) {
        return;
    }
    auto dc = it->second;
    controllers_.erase(it);
    reconciler_.forget(tid);
    if (!stopping_) {
        dc->forget_persisted_cache();
    }
    LOG_STAS_INFO("[Finder] Discovery controller %s removed.", tid.to_string().c_str());
    for (const auto& listener : dc_removed_listeners_) {
        listener(tid);
    }
    schedule_audit();
}

void FinderManager::log_pages_changed(DiscoveryController& dc,
                                      const std::vector<DiscoveryLogEntry>& added,
                                      const std::vector<DiscoveryLogEntry>& removed) {
    LOG_STAS_DEBUG("[Finder] %s log pages changed (+%zu/-%zu).",
                   dc.tid().to_string().c_str(),
                   added.size(),
                   removed.size());
    for (const auto& listener : log_pages_listeners_) {
        listener(dc.tid(), dc.device());
    }
}

void FinderManager::referrals_changed(DiscoveryController& dc) {
    LOG_STAS_DEBUG("[Finder] %s referrals changed.", dc.tid().to_string().c_str());
    schedule_audit();
}

} // namespace engine
} // namespace nvmestas
