/**
 * @file controller.h
 * @brief Per-TID connection lifecycle shared by discovery and I/O controllers.
 * @details
 * @code
 *   IDLE -> CONNECTING -> CONNECTED
 *              |  ^          |  (kernel "remove")
 *              v  |          v
 *           RETRY_WAIT <-----+
 *              |
 *              +-> SUSPENDED (NCC give-up)   +-> FAILED (ctrl-loss-tmo)
 *   any -> DISCONNECTING -> IDLE (removal, terminal)
 *   any -> INVALID (permanent error, never retried)
 * @endcode
 * All methods run on the dispatcher thread. Blocking NVMe calls go to the Executor,
 * at most one at a time per controller, and their completion is posted back to the
 * Dispatcher before any field is touched.
 */
#ifndef STAS_CONTROLLER_H
#define STAS_CONTROLLER_H

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "configuration/stas_config_types.h"
#include "controller_observer.h"
#include "../dispatcher/dispatcher.h"
#include "../dispatcher/restartable_timer.h"
#include "../dispatcher/worker_pool.h"
#include "../kernel/device_event.h"
#include "../kernel/nvme_control.h"
#include "../transport/transport_id.h"

namespace nvmestas {
namespace engine {

enum class ControllerState {
    Idle,
    Connecting,
    Connected,
    RetryWait,
    Disconnecting,
    Suspended,
    Failed,
    Invalid
};

const char* to_string(ControllerState state);

/** @brief First reconnect after the kernel reported the device gone. */
inline constexpr std::chrono::seconds kFastRetryPeriod{3};

/** @brief Collaborators every controller needs. Owned by the engine. */
struct ControllerContext {
    Dispatcher& dispatcher;
    Executor& executor;
    NvmeControl& nvme;
    const config::StasConfig& config;
};

using ControllerInfo = std::map<std::string, std::string>;

class Controller : public std::enable_shared_from_this<Controller> {
public:
    Controller(ControllerContext& context,
               TransportId tid,
               config::ConnectionParams params,
               ControllerObserver* observer);
    virtual ~Controller();

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;

    /** @brief IDLE -> CONNECTING right away. Ignored in any other state. */
    void start();

    /**
     * @brief Removes the controller from the desired state.
     * @param keep_connection Leave the kernel connection in place (policy decision).
     * @details Cancels the retry timer. If a blocking call is running, the removal
     *          happens when it completes.
     */
    void remove(bool keep_connection);

    /** @brief Kernel uevent for this controller's device. */
    void on_device_event(const DeviceEvent& event);

    /** @brief New parameters apply to the next connection. Live ones are left alone. */
    void set_connection_params(const config::ConnectionParams& params) { params_ = params; }

    ControllerState state() const { return state_; }
    const TransportId& tid() const { return tid_; }
    const std::string& device() const { return device_; }
    const config::ConnectionParams& connection_params() const { return params_; }
    int connect_attempts() const { return connect_attempts_; }
    bool connected() const { return state_ == ControllerState::Connected; }

    bool owned() const { return owned_; }
    void set_owned(bool owned) { owned_ = owned; }

    bool pending_removal() const { return pending_removal_; }
    bool removal_requested() const { return removal_requested_; }
    bool operation_in_flight() const { return op_in_flight_; }

    /** @brief When the current run of unsuccessful attempts started, if one is ongoing. */
    std::optional<Clock::time_point> failing_since() const { return first_failure_; }

    virtual ControllerInfo info() const;

protected:
    /** @brief Entered CONNECTED. */
    virtual void on_connected() {}

    /** @brief Left CONNECTED (kernel removal or disposal). Cancel follow-up work here. */
    virtual void on_connection_lost() {}

    virtual void on_aen(uint32_t aen) { (void)aen; }
    virtual void on_nvme_event(const std::string& event) { (void)event; }

    /** @brief Consulted after each failed connect. True moves to SUSPENDED. */
    virtual bool should_suspend() const { return false; }

    /** @brief SUSPENDED/RETRY_WAIT -> CONNECTING with a fresh attempt counter. */
    void resume();

    /**
     * @brief Runs a follow-up call (Get Log Page, registration) on the executor.
     * @details `done` is only called if the controller still exists and no removal is
     *          pending. Returns false if an operation is already running or the
     *          executor refused the job.
     */
    template <typename R>
    bool run_operation(std::function<R()> work, std::function<void(R)> done) {
        if (op_in_flight_) {
            return false;
        }
        op_in_flight_ = true;
        std::weak_ptr<Controller> weak = weak_from_this();
        bool queued = run_blocking<R>(
            context_.executor, context_.dispatcher, std::move(work), [weak, done](R result) {
                auto self = weak.lock();
                if (!self || !self->operation_finished()) {
                    return;
                }
                done(std::move(result));
            });
        if (!queued) {
            op_in_flight_ = false;
        }
        return queued;
    }

    HostIdentity host_identity() const;
    ControllerContext& context() { return context_; }
    const ControllerContext& context() const { return context_; }
    ControllerObserver* observer() const { return observer_; }

private:
    void launch_connect();
    void handle_connect_result(ConnectResult result);
    void handle_kernel_removal();
    void on_retry_timer();
    bool operation_finished();
    void begin_disconnect();
    void finish_removal();
    void enter_invalid(const std::string& reason);
    void set_state(ControllerState state);

    ControllerContext& context_;
    TransportId tid_;
    config::ConnectionParams params_;
    ControllerObserver* observer_;

    ControllerState state_ = ControllerState::Idle;
    std::string device_;
    int connect_attempts_ = 0;
    std::optional<Clock::time_point> first_failure_;
    RestartableTimer retry_timer_;

    bool owned_ = false;
    bool keep_connection_ = false;
    bool op_in_flight_ = false;
    bool pending_removal_ = false;
    bool removal_requested_ = false;
    bool retry_after_op_ = false;
    bool invalid_reported_ = false;
};

} // namespace engine
} // namespace nvmestas

#endif // STAS_CONTROLLER_H
