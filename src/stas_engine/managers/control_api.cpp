#include "control_api.h"

#include "../stas_engine.h"
#include "../utils/stas_logger.h"

namespace nvmestas {
namespace engine {

namespace {

ControllerInfo brief_info(const Controller& controller) {
    ControllerInfo result = controller.tid().as_fields();
    result["device"] = controller.device();
    return result;
}

std::vector<TidFields> entries_as_fields(const std::vector<DiscoveryLogEntry>& entries) {
    std::vector<TidFields> result;
    result.reserve(entries.size());
    for (const auto& entry : entries) {
        result.push_back(entry.as_fields());
    }
    return result;
}

} // namespace

bool EngineControl::tron() const {
    return engine_.dispatcher().invoke<bool>([this]() { return engine_.tron(); });
}

void EngineControl::set_tron(bool enabled) {
    engine_.dispatcher().invoke<void>([this, enabled]() { engine_.set_tron(enabled); });
}

std::string EngineControl::log_level() const {
    return logging::log_level_name(logging::get_stas_log_level());
}

ControllerInfo EngineControl::process_info() const {
    return engine_.dispatcher().invoke<ControllerInfo>([this]() { return engine_.process_info(); });
}

std::vector<ControllerInfo> EngineControl::list_controllers(bool detailed) const {
    return engine_.dispatcher().invoke<std::vector<ControllerInfo>>([this, detailed]() {
        std::vector<ControllerInfo> result;
        for (const auto& controller : current_controllers()) {
            result.push_back(detailed ? controller->info() : brief_info(*controller));
        }
        return result;
    });
}

std::optional<ControllerInfo> EngineControl::controller_info(const TidFields& tid) const {
    std::string error;
    auto wanted = parse_transport_id(tid, &error);
    if (!wanted) {
        LOG_STAS_DEBUG("controller_info: %s", error.c_str());
        return std::nullopt;
    }
    return engine_.dispatcher().invoke<std::optional<ControllerInfo>>(
        [this, &wanted]() -> std::optional<ControllerInfo> {
            for (const auto& controller : current_controllers()) {
                if (TransportId::matches(controller->tid(), *wanted)) {
                    return controller->info();
                }
            }
            return std::nullopt;
        });
}

bool EngineControl::reload() {
    return engine_.dispatcher().invoke<bool>([this]() { return engine_.reload_configuration(); });
}

std::vector<std::shared_ptr<Controller>> FinderControlApi::current_controllers() const {
    std::vector<std::shared_ptr<Controller>> result;
    for (const auto& dc : engine().finder().controllers()) {
        result.push_back(dc);
    }
    return result;
}

std::optional<std::vector<TidFields>> FinderControlApi::get_log_pages(const TidFields& dc) const {
    auto wanted = parse_transport_id(dc);
    if (!wanted) {
        return std::nullopt;
    }
    const TransportId tid = wanted->with_kind(ControllerKind::Discovery);
    return engine().dispatcher().invoke<std::optional<std::vector<TidFields>>>(
        [this, &tid]() -> std::optional<std::vector<TidFields>> {
            auto controller = engine().finder().find(tid);
            if (!controller) {
                return std::nullopt;
            }
            return entries_as_fields(controller->cache());
        });
}

std::vector<LogPagesInfo> FinderControlApi::get_all_log_pages() const {
    return engine().dispatcher().invoke<std::vector<LogPagesInfo>>([this]() {
        std::vector<LogPagesInfo> result;
        for (const auto& dc : engine().finder().controllers()) {
            LogPagesInfo info;
            info.dc = brief_info(*dc);
            info.entries = entries_as_fields(dc->cache());
            result.push_back(std::move(info));
        }
        return result;
    });
}

void FinderControlApi::subscribe_log_pages_changed(LogPagesChangedCallback callback) {
    engine().dispatcher().invoke<void>([this, &callback]() {
        engine().finder().add_log_pages_listener(
            [callback](const TransportId& dc, const std::string& device) { callback(dc.as_fields(), device); });
    });
}

std::vector<std::shared_ptr<Controller>> ConnectorControlApi::current_controllers() const {
    std::vector<std::shared_ptr<Controller>> result;
    for (const auto& ioc : engine().connector().controllers()) {
        result.push_back(ioc);
    }
    return result;
}

} // namespace engine
} // namespace nvmestas
