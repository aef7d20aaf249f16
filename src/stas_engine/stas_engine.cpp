#include "stas_engine.h"

#include <unistd.h>

#include "configuration/config_loader.h"
#include "utils/stas_logger.h"

#ifndef NVMESTAS_VERSION
#define NVMESTAS_VERSION "unknown"
#endif

namespace nvmestas {
namespace engine {

StasEngine::StasEngine(config::StasConfig config, EngineDependencies deps)
    : config_(std::move(config)),
      deps_(deps),
      dispatcher_(deps.clock),
      context_{dispatcher_, deps.executor, deps.nvme, config_},
      store_(std::make_unique<LastKnownConfig>(config_.state_dir + "/lkc")) {
    finder_ = std::make_unique<FinderManager>(context_, deps_.inventory, directory_, store_.get());
    connector_ = std::make_unique<ConnectorManager>(context_, deps_.inventory, *finder_);
    finder_control_ = std::make_unique<FinderControlApi>(*this);
    connector_control_ = std::make_unique<ConnectorControlApi>(*this);

    finder_->add_log_pages_listener(
        [this](const TransportId& dc, const std::string&) { connector_->on_log_pages_changed(dc); });
    finder_->add_dc_removed_listener([this](const TransportId& dc) { connector_->on_dc_removed(dc); });
}

StasEngine::~StasEngine() {
    if (service_discovery_running_ && deps_.service_source) {
        deps_.service_source->stop();
    }
    dispatcher_.stop();
}

const char* StasEngine::version() {
    return NVMESTAS_VERSION;
}

bool StasEngine::start() {
    if (started_) {
        return true;
    }
    if (config_.host.nqn.empty()) {
        LOG_STAS_ERROR("No host NQN configured, refusing to start.");
        return false;
    }
    started_ = true;
    started_at_ = dispatcher_.clock().now();
    set_tron(config_.global.tron);
    LOG_STAS_INFO("nvme-stas %s starting (host NQN %s).", version(), config_.host.nqn.c_str());

    start_service_discovery();
    finder_->start();
    connector_->start();
    return true;
}

void StasEngine::start_service_discovery() {
    if (!deps_.service_source || !config_.service_discovery.zeroconf_enabled) {
        return;
    }
    // Sources call back on their own thread, the directory is only touched by the loop.
    auto on_added = [this](const ServiceAnnouncement& announcement) {
        dispatcher_.post([this, announcement]() {
            if (service_discovery_running_ && directory_.upsert(announcement)) {
                finder_->on_services_changed();
            }
        });
    };
    auto on_removed = [this](const std::string& id) {
        dispatcher_.post([this, id]() {
            if (service_discovery_running_ && directory_.remove(id)) {
                finder_->on_services_changed();
            }
        });
    };
    service_discovery_running_ = deps_.service_source->start(on_added, on_removed);
    if (!service_discovery_running_) {
        LOG_STAS_WARNING("Service discovery unavailable, only configured discovery controllers will be used.");
    }
}

void StasEngine::run() {
    dispatcher_.run();
    LOG_STAS_INFO("Dispatcher loop exited.");
}

void StasEngine::request_stop() {
    if (!dispatcher_.post([this]() { begin_shutdown(); })) {
        LOG_STAS_DEBUG("Stop requested after the dispatcher stopped.");
    }
}

void StasEngine::request_reload() {
    dispatcher_.post([this]() { reload_configuration(); });
}

void StasEngine::post_device_event(DeviceEvent event) {
    dispatcher_.post([this, event]() {
        if (stopping_) {
            return;
        }
        finder_->on_device_event(event);
        connector_->on_device_event(event);
    });
}

void StasEngine::begin_shutdown() {
    if (stopping_) {
        return;
    }
    stopping_ = true;
    LOG_STAS_INFO("Shutting down.");
    if (service_discovery_running_ && deps_.service_source) {
        deps_.service_source->stop();
        service_discovery_running_ = false;
    }
    connector_->shutdown();
    finder_->shutdown();
    shutdown_deadline_ = dispatcher_.clock().now() + kShutdownDrainTimeout;
    poll_shutdown();
}

void StasEngine::poll_shutdown() {
    const size_t remaining = finder_->size() + connector_->size();
    if (remaining == 0) {
        LOG_STAS_INFO("All controllers released.");
        dispatcher_.stop();
        return;
    }
    if (dispatcher_.clock().now() >= shutdown_deadline_) {
        LOG_STAS_WARNING("%zu controllers still busy after %lld s, exiting anyway.",
                         remaining,
                         static_cast<long long>(kShutdownDrainTimeout.count()));
        dispatcher_.stop();
        return;
    }
    dispatcher_.schedule_after(kShutdownPollPeriod, [this]() { poll_shutdown(); });
}

bool StasEngine::reload_configuration() {
    if (config_.conf_file.empty()) {
        LOG_STAS_WARNING("Reload requested but no configuration file is known.");
        return false;
    }
    config::ConfigLoader loader;
    config::StasConfig fresh;
    if (!loader.load_file(config_.conf_file, fresh)) {
        LOG_STAS_ERROR("Cannot read %s, keeping the current configuration.", config_.conf_file.c_str());
        return false;
    }
    if (!loader.warnings().empty()) {
        LOG_STAS_INFO("%s loaded with %zu warnings.", config_.conf_file.c_str(), loader.warnings().size());
    }
    apply_config(std::move(fresh));
    return true;
}

void StasEngine::apply_config(config::StasConfig config) {
    if (config.host.nqn.empty()) {
        LOG_STAS_WARNING("New configuration has no host NQN, keeping %s.", config_.host.nqn.c_str());
        config.host = config_.host;
    }
    // The state directory is fixed for the lifetime of the process.
    config.state_dir = config_.state_dir;
    config_ = std::move(config);
    LOG_STAS_INFO("Configuration reloaded.");
    set_tron(config_.global.tron);
    if (stopping_) {
        return;
    }
    if (started_ && deps_.service_source) {
        if (config_.service_discovery.zeroconf_enabled && !service_discovery_running_) {
            start_service_discovery();
        } else if (!config_.service_discovery.zeroconf_enabled && service_discovery_running_) {
            deps_.service_source->stop();
            service_discovery_running_ = false;
            directory_.clear();
        }
    }
    finder_->reload();
    connector_->reload();
}

void StasEngine::set_tron(bool enabled) {
    config_.global.tron = enabled;
    logging::set_stas_log_level(enabled ? logging::LogLevel::DEBUG : logging::LogLevel::INFO);
    LOG_STAS_INFO("Trace %s.", enabled ? "on" : "off");
}

ControllerInfo StasEngine::process_info() const {
    ControllerInfo info;
    info["version"] = version();
    info["pid"] = std::to_string(::getpid());
    info["conf-file"] = config_.conf_file;
    info["state-dir"] = config_.state_dir;
    info["log-level"] = logging::log_level_name(logging::get_stas_log_level());
    info["tron"] = config_.global.tron ? "true" : "false";
    info["host-nqn"] = config_.host.nqn;
    info["discovery-controllers"] = std::to_string(finder_->size());
    info["io-controllers"] = std::to_string(connector_->size());
    info["mdns-services"] = std::to_string(directory_.size());
    if (started_) {
        const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(dispatcher_.clock().now() - started_at_);
        info["uptime"] = std::to_string(uptime.count());
    }
    return info;
}

} // namespace engine
} // namespace nvmestas
