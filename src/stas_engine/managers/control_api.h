/**
 * @file control_api.h
 * @brief Fixed control surface of the daemon.
 * @details A bus adaptor (D-Bus or anything else) binds to these interfaces. Every call
 *          may come from any thread. The implementations forward it to the dispatcher
 *          thread and wait for the answer, so no engine state is read concurrently.
 */
#ifndef STAS_CONTROL_API_H
#define STAS_CONTROL_API_H

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../controllers/controller.h"
#include "../transport/discovery_log_entry.h"
#include "../transport/transport_id.h"

namespace nvmestas {
namespace engine {

class StasEngine;

class ControlApi {
public:
    virtual ~ControlApi() = default;

    virtual bool tron() const = 0;
    virtual void set_tron(bool enabled) = 0;
    virtual std::string log_level() const = 0;
    virtual ControllerInfo process_info() const = 0;

    /** @brief One map per controller. `detailed` adds state and bookkeeping fields. */
    virtual std::vector<ControllerInfo> list_controllers(bool detailed) const = 0;

    /** @brief Looks the controller up with the relaxed TID match. */
    virtual std::optional<ControllerInfo> controller_info(const TidFields& tid) const = 0;

    /** @brief Re-reads the configuration file. Returns false if it could not be read. */
    virtual bool reload() = 0;
};

/** @brief Shared implementation over a running StasEngine. */
class EngineControl : public ControlApi {
public:
    explicit EngineControl(StasEngine& engine) : engine_(engine) {}

    bool tron() const override;
    void set_tron(bool enabled) override;
    std::string log_level() const override;
    ControllerInfo process_info() const override;
    std::vector<ControllerInfo> list_controllers(bool detailed) const override;
    std::optional<ControllerInfo> controller_info(const TidFields& tid) const override;
    bool reload() override;

protected:
    /** @brief The controllers this surface reports on. Dispatcher thread only. */
    virtual std::vector<std::shared_ptr<Controller>> current_controllers() const = 0;

    StasEngine& engine() const { return engine_; }

private:
    StasEngine& engine_;
};

struct LogPagesInfo {
    ControllerInfo dc;
    std::vector<TidFields> entries;
};

class FinderControlApi : public EngineControl {
public:
    using LogPagesChangedCallback = std::function<void(const TidFields& dc, const std::string& device)>;

    explicit FinderControlApi(StasEngine& engine) : EngineControl(engine) {}

    /** @brief Cached log page of one DC, std::nullopt if no such DC is known. */
    std::optional<std::vector<TidFields>> get_log_pages(const TidFields& dc) const;

    std::vector<LogPagesInfo> get_all_log_pages() const;

    /** @brief `callback` runs on the dispatcher thread whenever a DC's cache changes. */
    void subscribe_log_pages_changed(LogPagesChangedCallback callback);

protected:
    std::vector<std::shared_ptr<Controller>> current_controllers() const override;
};

class ConnectorControlApi : public EngineControl {
public:
    explicit ConnectorControlApi(StasEngine& engine) : EngineControl(engine) {}

protected:
    std::vector<std::shared_ptr<Controller>> current_controllers() const override;
};

} // namespace engine
} // namespace nvmestas

#endif // STAS_CONTROL_API_H
