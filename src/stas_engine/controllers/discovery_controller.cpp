#include "discovery_controller.h"

#include <algorithm>
#include <iterator>

#include "../utils/stas_logger.h"

namespace nvmestas {
namespace engine {

namespace {

bool contains(const std::vector<DiscoveryLogEntry>& entries, const DiscoveryLogEntry& entry) {
    return std::find(entries.begin(), entries.end(), entry) != entries.end();
}

std::vector<DiscoveryLogEntry> only_referrals(const std::vector<DiscoveryLogEntry>& entries) {
    std::vector<DiscoveryLogEntry> result;
    std::copy_if(entries.begin(), entries.end(), std::back_inserter(result),
                 [](const DiscoveryLogEntry& entry) { return entry.is_referral(); });
    return result;
}

} // namespace

const char* to_string(DcOrigin origin) {
    switch (origin) {
        case DcOrigin::Configured: return "configured";
        case DcOrigin::Discovered: return "discovered";
        case DcOrigin::Referral: return "referral";
    }
    return "unknown";
}

DcOrigin parse_dc_origin(const std::string& text) {
    if (text == "discovered") {
        return DcOrigin::Discovered;
    }
    if (text == "referral") {
        return DcOrigin::Referral;
    }
    return DcOrigin::Configured;
}

DiscoveryController::DiscoveryController(ControllerContext& context,
                                         TransportId tid,
                                         config::ConnectionParams params,
                                         ControllerObserver* observer,
                                         DcOrigin origin,
                                         LastKnownConfig* store)
    : Controller(context, tid.with_kind(ControllerKind::Discovery), std::move(params), observer),
      origin_(origin),
      store_(store),
      log_page_timer_(context.dispatcher, kLogPageRetryPeriod, [this]() { request_log_page(); }),
      registration_timer_(context.dispatcher, kRegistrationRetryPeriod, [this]() { request_registration(); }) {}

DiscoveryController::~DiscoveryController() {
    log_page_timer_.stop();
    registration_timer_.stop();
}

void DiscoveryController::set_provisional_cache(std::vector<DiscoveryLogEntry> entries) {
    cache_ = std::move(entries);
    provisional_ = true;
    LOG_STAS_INFO("%s | Restored %zu log page entries from the last known configuration.",
                  tid().to_string().c_str(),
                  cache_.size());
}

std::vector<DiscoveryLogEntry> DiscoveryController::referrals() const {
    return only_referrals(cache_);
}

void DiscoveryController::on_connected() {
    if (!host_identity().symname.empty()) {
        request_registration();
    } else {
        request_log_page();
    }
}

void DiscoveryController::on_connection_lost() {
    log_page_timer_.stop();
    registration_timer_.stop();
    refresh_requested_ = false;
    registration_requested_ = false;
    registered_ = false;
}

void DiscoveryController::on_aen(uint32_t aen) {
    if (aen == kAenDiscoveryLogChanged) {
        request_log_page();
    }
}

void DiscoveryController::on_nvme_event(const std::string& event) {
    if (event == "rediscover") {
        LOG_STAS_DEBUG("%s | %s - Kernel asked for rediscovery.", tid().to_string().c_str(), device().c_str());
        on_connected();
    } else if (event == "connected") {
        // Device attributes may not be set up yet, "rediscover" follows.
        LOG_STAS_DEBUG("%s | %s - Ignoring \"connected\" event.", tid().to_string().c_str(), device().c_str());
    }
}

void DiscoveryController::request_registration() {
    if (!connected()) {
        return;
    }
    registration_timer_.stop();
    NvmeControl& nvme = context().nvme;
    const std::string device_name = device();
    const HostIdentity host = host_identity();
    bool started = run_operation<OpStatus>(
        [&nvme, device_name, host]() { return nvme.register_host(device_name, host); },
        [this](OpStatus status) { handle_registration(std::move(status)); });
    if (!started) {
        if (operation_in_flight()) {
            registration_requested_ = true;
        } else {
            registration_timer_.start();
        }
    }
}

void DiscoveryController::handle_registration(OpStatus status) {
    if (!status.ok()) {
        LOG_STAS_WARNING("%s | %s - Registration failed: %s",
                         tid().to_string().c_str(),
                         device().c_str(),
                         status.message.c_str());
        if (!registration_requested_) {
            registration_timer_.start();
        }
        run_pending_requests();
        return;
    }
    registered_ = true;
    LOG_STAS_DEBUG("%s | %s - Registration complete.", tid().to_string().c_str(), device().c_str());
    refresh_requested_ = false;
    if (registration_requested_) {
        run_pending_requests();
    } else {
        request_log_page();
    }
}

void DiscoveryController::request_log_page() {
    if (!connected()) {
        return;
    }
    if (operation_in_flight()) {
        refresh_requested_ = true;
        return;
    }
    log_page_timer_.stop();
    NvmeControl& nvme = context().nvme;
    const std::string device_name = device();
    const bool pleo = context().config.global.pleo_enabled;
    bool started = run_operation<LogPageResult>(
        [&nvme, device_name, pleo]() { return nvme.get_log_page(device_name, pleo); },
        [this](LogPageResult result) { handle_log_page(std::move(result)); });
    if (!started) {
        log_page_timer_.start();
    }
}

void DiscoveryController::handle_log_page(LogPageResult result) {
    if (!result.status.ok()) {
        LOG_STAS_WARNING("%s | %s - Get Log Page failed, retrying in %lld s: %s",
                         tid().to_string().c_str(),
                         device().c_str(),
                         static_cast<long long>(kLogPageRetryPeriod.count()),
                         result.status.message.c_str());
        log_page_timer_.start();
        run_pending_requests();
        return;
    }
    replace_cache(filter_invalid_entries(result.entries));
    run_pending_requests();
}

void DiscoveryController::run_pending_requests() {
    // A registration is followed by a log page read, which covers a pending refresh.
    if (registration_requested_) {
        registration_requested_ = false;
        refresh_requested_ = false;
        request_registration();
    } else if (refresh_requested_) {
        refresh_requested_ = false;
        request_log_page();
    }
}

void DiscoveryController::replace_cache(std::vector<DiscoveryLogEntry> entries) {
    std::vector<DiscoveryLogEntry> added;
    std::vector<DiscoveryLogEntry> removed;
    for (const auto& entry : entries) {
        if (!contains(cache_, entry)) {
            added.push_back(entry);
        }
    }
    for (const auto& entry : cache_) {
        if (!contains(entries, entry)) {
            removed.push_back(entry);
        }
    }

    const bool referrals_differ = only_referrals(cache_) != only_referrals(entries);
    const bool was_provisional = provisional_;
    cache_ = std::move(entries);
    provisional_ = false;

    LOG_STAS_INFO("%s | %s - Log page has %zu entries (%zu added, %zu removed).",
                  tid().to_string().c_str(),
                  device().c_str(),
                  cache_.size(),
                  added.size(),
                  removed.size());

    if (was_provisional || !added.empty() || !removed.empty()) {
        persist_cache();
    }

    if (observer() && (!added.empty() || !removed.empty())) {
        observer()->log_pages_changed(*this, added, removed);
        if (referrals_differ) {
            observer()->referrals_changed(*this);
        }
    }
}

void DiscoveryController::persist_cache() {
    if (!store_) {
        return;
    }
    if (store_write_in_flight_) {
        store_save_pending_ = true;
        return;
    }
    start_store_write(false);
}

void DiscoveryController::forget_persisted_cache() {
    if (!store_) {
        return;
    }
    store_save_pending_ = false;
    if (store_write_in_flight_) {
        store_remove_pending_ = true;
        return;
    }
    start_store_write(true);
}

void DiscoveryController::start_store_write(bool remove) {
    LastKnownConfig* store = store_;
    const TransportId dc = tid();
    std::function<bool()> work;
    if (remove) {
        work = [store, dc]() { return store->remove(dc); };
    } else {
        work = [store, dc, cache = cache_, origin = std::string(to_string(origin_))]() {
            return store->save(dc, cache, origin);
        };
    }
    // The owner may drop this controller right after forget_persisted_cache().
    std::shared_ptr<Controller> self = shared_from_this();
    store_write_in_flight_ = true;
    bool queued = run_blocking<bool>(context().executor, context().dispatcher, std::move(work), [this, self](bool) {
        store_write_done();
    });
    if (!queued) {
        store_write_in_flight_ = false;
        LOG_STAS_WARNING("%s | Worker pool unavailable, last known configuration not updated.",
                         tid().to_string().c_str());
    }
}

void DiscoveryController::store_write_done() {
    store_write_in_flight_ = false;
    if (store_remove_pending_) {
        store_remove_pending_ = false;
        start_store_write(true);
    } else if (store_save_pending_) {
        store_save_pending_ = false;
        start_store_write(false);
    }
}

ControllerInfo DiscoveryController::info() const {
    ControllerInfo result = Controller::info();
    result["origin"] = to_string(origin_);
    result["log-page-entries"] = std::to_string(cache_.size());
    result["provisional"] = provisional_ ? "true" : "false";
    result["registered"] = registered_ ? "true" : "false";
    return result;
}

} // namespace engine
} // namespace nvmestas
