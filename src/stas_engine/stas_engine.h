#ifndef STAS_ENGINE_H
#define STAS_ENGINE_H

#include <memory>
#include <string>

#include "configuration/stas_config_types.h"
#include "controllers/controller.h"
#include "discovery/service_directory.h"
#include "discovery/service_discovery_source.h"
#include "dispatcher/dispatcher.h"
#include "dispatcher/worker_pool.h"
#include "kernel/device_event.h"
#include "kernel/kernel_inventory.h"
#include "kernel/nvme_control.h"
#include "managers/connector_manager.h"
#include "managers/control_api.h"
#include "managers/finder_manager.h"
#include "persistence/last_known_config.h"

namespace nvmestas {
namespace engine {

/** @brief Grace period for in-flight disconnects when the daemon stops. */
inline constexpr std::chrono::seconds kShutdownDrainTimeout{5};
inline constexpr std::chrono::milliseconds kShutdownPollPeriod{100};

/** @brief Collaborators supplied by the caller. They must outlive the engine. */
struct EngineDependencies {
    const Clock& clock;
    Executor& executor;
    NvmeControl& nvme;
    KernelInventory& inventory;
    ServiceDiscoverySource* service_source = nullptr;   // optional
};

/**
 * @brief Central orchestrator of the daemon.
 * Owns the dispatcher, the finder (discovery controllers) and the connector (I/O
 * controllers), wires them together and provides the control surfaces.
 */
class StasEngine {
public:
    StasEngine(config::StasConfig config, EngineDependencies deps);
    ~StasEngine();

    // Prevent copying/moving
    StasEngine(const StasEngine&) = delete;
    StasEngine& operator=(const StasEngine&) = delete;
    StasEngine(StasEngine&&) = delete;
    StasEngine& operator=(StasEngine&&) = delete;

    // --- Lifecycle Management ---
    /**
     * @brief Starts service discovery, restores the last known discovery controllers and
     *        schedules the first audits.
     * @details Call before run(), or from the dispatcher thread.
     * @return false if the configuration has no host NQN. Nothing is started then.
     */
    bool start();

    /** @brief Runs the dispatcher loop on the calling thread until shutdown completes. */
    void run();

    /**
     * @brief Begins a graceful shutdown. Safe to call from any thread (signal handler thread).
     * @details Controllers are released according to the configuration, then run()
     *          returns once every controller is gone or kShutdownDrainTimeout elapsed.
     */
    void request_stop();

    /** @brief Re-reads the configuration file on the dispatcher thread. Any thread. */
    void request_reload();

    /** @brief Queues a kernel event for both managers. Any thread. */
    void post_device_event(DeviceEvent event);

    // --- Dispatcher thread only ---
    /** @brief Replaces the configuration and lets both managers re-audit. */
    void apply_config(config::StasConfig config);

    /** @brief Reads config().conf_file again and applies it. Returns false if it could not be read. */
    bool reload_configuration();

    bool tron() const { return config_.global.tron; }
    void set_tron(bool enabled);

    /** @brief Version, pid, configuration file, log level and controller counts. */
    ControllerInfo process_info() const;

    bool stopping() const { return stopping_; }

    // --- Accessors ---
    const config::StasConfig& config() const { return config_; }
    Dispatcher& dispatcher() { return dispatcher_; }
    FinderManager& finder() { return *finder_; }
    ConnectorManager& connector() { return *connector_; }
    ServiceDirectory& service_directory() { return directory_; }
    LastKnownConfig& last_known_config() { return *store_; }
    FinderControlApi& finder_control() { return *finder_control_; }
    ConnectorControlApi& connector_control() { return *connector_control_; }

    static const char* version();

private:
    void begin_shutdown();
    void poll_shutdown();
    void start_service_discovery();

    config::StasConfig config_;
    EngineDependencies deps_;
    Dispatcher dispatcher_;
    ControllerContext context_;
    std::unique_ptr<LastKnownConfig> store_;
    ServiceDirectory directory_;
    std::unique_ptr<FinderManager> finder_;
    std::unique_ptr<ConnectorManager> connector_;
    std::unique_ptr<FinderControlApi> finder_control_;
    std::unique_ptr<ConnectorControlApi> connector_control_;

    Clock::time_point started_at_;
    Clock::time_point shutdown_deadline_;
    bool started_ = false;
    bool stopping_ = false;
    bool service_discovery_running_ = false;
};

} // namespace engine
} // namespace nvmestas

#endif // STAS_ENGINE_H
