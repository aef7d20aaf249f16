#include "controller.h"

#include "../utils/stas_logger.h"

namespace nvmestas {
namespace engine {

const char* to_string(ControllerState state) {
    switch (state) {
        case ControllerState::Idle: return "idle";
        case ControllerState::Connecting: return "connecting";
        case ControllerState::Connected: return "connected";
        case ControllerState::RetryWait: return "retry-wait";
        case ControllerState::Disconnecting: return "disconnecting";
        case ControllerState::Suspended: return "suspended";
        case ControllerState::Failed: return "failed";
        case ControllerState::Invalid: return "invalid";
    }
    return "unknown";
}

Controller::Controller(ControllerContext& context,
                       TransportId tid,
                       config::ConnectionParams params,
                       ControllerObserver* observer)
    : context_(context),
      tid_(std::move(tid)),
      params_(std::move(params)),
      observer_(observer),
      retry_timer_(context.dispatcher, std::chrono::seconds(params_.reconnect_delay), [this]() { on_retry_timer(); }) {}

Controller::~Controller() {
    retry_timer_.stop();
}

HostIdentity Controller::host_identity() const {
    HostIdentity host;
    host.nqn = context_.config.host.nqn;
    host.id = context_.config.host.id;
    host.symname = context_.config.host.symname;
    return host;
}

void Controller::start() {
    if (state_ != ControllerState::Idle || removal_requested_) {
        return;
    }
    if (tid_.transport().empty() || tid_.traddr().empty()) {
        enter_invalid("transport and traddr are mandatory");
        return;
    }
    if (context_.config.host.nqn.empty() && tid_.host_nqn().empty()) {
        enter_invalid("no host NQN configured");
        return;
    }
    set_state(ControllerState::Connecting);
    launch_connect();
}

void Controller::resume() {
    if (removal_requested_ ||
        (state_ != ControllerState::Suspended && state_ != ControllerState::RetryWait)) {
        return;
    }
    retry_timer_.stop();
    connect_attempts_ = 0;
    first_failure_.reset();
    if (op_in_flight_) {
        // A follow-up call is still running. Reconnect as soon as it completes.
        set_state(ControllerState::RetryWait);
        retry_after_op_ = true;
        return;
    }
    set_state(ControllerState::Connecting);
    launch_connect();
}

void Controller::launch_connect() {
    op_in_flight_ = true;
    NvmeControl& nvme = context_.nvme;
    const TransportId tid = tid_;
    const config::ConnectionParams params = params_;
    const HostIdentity host = host_identity();
    std::weak_ptr<Controller> weak = weak_from_this();

    LOG_STAS_DEBUG("%s | Connecting (attempt %d).", tid_.to_string().c_str(), connect_attempts_ + 1);
    bool queued = run_blocking<ConnectResult>(
        context_.executor,
        context_.dispatcher,
        [&nvme, tid, params, host]() {
            if (auto device = nvme.find_existing(tid)) {
                ConnectResult adopted;
                adopted.device = *device;
                adopted.adopted = true;
                return adopted;
            }
            return nvme.connect(tid, params, host);
        },
        [weak](ConnectResult result) {
            if (auto self = weak.lock()) {
                self->handle_connect_result(std::move(result));
            }
        });

    if (!queued) {
        op_in_flight_ = false;
        ConnectResult refused;
        refused.status = OpStatus::transient("worker pool is not accepting jobs");
        handle_connect_result(std::move(refused));
    }
}

void Controller::handle_connect_result(ConnectResult result) {
    op_in_flight_ = false;

    if (pending_removal_) {
        if (result.status.ok()) {
            device_ = result.device;
        }
        begin_disconnect();
        return;
    }

    if (result.status.ok()) {
        device_ = result.device;
        connect_attempts_ = 0;
        first_failure_.reset();
        LOG_STAS_INFO("%s | %s - %s.",
                      tid_.to_string().c_str(),
                      device_.c_str(),
                      result.adopted ? "Adopted existing connection" : "Connection established");
        set_state(ControllerState::Connected);
        on_connected();
        return;
    }

    ++connect_attempts_;
    if (result.status.kind == ErrorKind::Permanent) {
        enter_invalid(result.status.message);
        return;
    }

    LOG_STAS_WARNING("%s | Failed to connect (attempt %d): %s",
                     tid_.to_string().c_str(),
                     connect_attempts_,
                     result.status.message.c_str());

    const auto now = context_.dispatcher.clock().now();
    if (!first_failure_) {
        first_failure_ = now;
    }

    if (should_suspend()) {
        LOG_STAS_INFO("%s | NCC asserted after %d attempts, suspending until the log page changes.",
                      tid_.to_string().c_str(),
                      connect_attempts_);
        set_state(ControllerState::Suspended);
        return;
    }

    if (params_.ctrl_loss_tmo == 0 ||
        (params_.ctrl_loss_tmo > 0 && now - *first_failure_ >= std::chrono::seconds(params_.ctrl_loss_tmo))) {
        LOG_STAS_ERROR("%s | Giving up after %d attempts (ctrl-loss-tmo=%d).",
                       tid_.to_string().c_str(),
                       connect_attempts_,
                       params_.ctrl_loss_tmo);
        set_state(ControllerState::Failed);
        return;
    }

    set_state(ControllerState::RetryWait);
    retry_timer_.start(std::chrono::seconds(params_.reconnect_delay));
}

void Controller::on_retry_timer() {
    if (state_ != ControllerState::RetryWait || removal_requested_) {
        return;
    }
    if (op_in_flight_) {
        retry_after_op_ = true;
        return;
    }
    set_state(ControllerState::Connecting);
    launch_connect();
}

bool Controller::operation_finished() {
    op_in_flight_ = false;
    if (pending_removal_) {
        begin_disconnect();
        return false;
    }
    if (retry_after_op_) {
        retry_after_op_ = false;
        if (state_ == ControllerState::RetryWait) {
            set_state(ControllerState::Connecting);
            launch_connect();
        }
        return false;
    }
    return state_ == ControllerState::Connected;
}

void Controller::on_device_event(const DeviceEvent& event) {
    if (device_.empty() || event.device != device_) {
        return;
    }

    if (event.is_remove()) {
        LOG_STAS_INFO("%s | %s - Received \"remove\" event.", tid_.to_string().c_str(), device_.c_str());
        handle_kernel_removal();
        return;
    }

    if (event.is_change() && state_ == ControllerState::Connected) {
        if (auto aen = event.aen()) {
            LOG_STAS_INFO("%s | %s - Received AEN: 0x%06x", tid_.to_string().c_str(), device_.c_str(), *aen);
            on_aen(*aen);
        }
        const std::string nvme_event = event.nvme_event();
        if (!nvme_event.empty()) {
            on_nvme_event(nvme_event);
        }
    }
}

void Controller::handle_kernel_removal() {
    device_.clear();
    if (removal_requested_) {
        // Already on the way out. Nothing left to disconnect.
        return;
    }
    if (state_ != ControllerState::Connected) {
        return;
    }
    on_connection_lost();
    connect_attempts_ = 0;
    first_failure_.reset();
    set_state(ControllerState::RetryWait);
    retry_timer_.start(kFastRetryPeriod);
}

void Controller::remove(bool keep_connection) {
    if (removal_requested_) {
        return;
    }
    removal_requested_ = true;
    keep_connection_ = keep_connection;
    retry_timer_.stop();
    retry_after_op_ = false;
    if (state_ == ControllerState::Connected) {
        on_connection_lost();
    }

    if (op_in_flight_) {
        LOG_STAS_DEBUG("%s | Removal deferred until the running operation completes.", tid_.to_string().c_str());
        pending_removal_ = true;
        return;
    }
    begin_disconnect();
}

void Controller::begin_disconnect() {
    pending_removal_ = false;
    set_state(ControllerState::Disconnecting);

    if (device_.empty() || keep_connection_) {
        if (!device_.empty()) {
            LOG_STAS_INFO("%s | %s - Leaving connection in place.", tid_.to_string().c_str(), device_.c_str());
        }
        finish_removal();
        return;
    }

    op_in_flight_ = true;
    NvmeControl& nvme = context_.nvme;
    const std::string device = device_;
    std::weak_ptr<Controller> weak = weak_from_this();
    LOG_STAS_INFO("%s | %s - Disconnecting.", tid_.to_string().c_str(), device_.c_str());

    bool queued = run_blocking<OpStatus>(
        context_.executor,
        context_.dispatcher,
        [&nvme, device]() { return nvme.disconnect(device); },
        [weak](OpStatus status) {
            auto self = weak.lock();
            if (!self) {
                return;
            }
            self->op_in_flight_ = false;
            if (!status.ok()) {
                LOG_STAS_WARNING("%s | %s - Disconnect failed: %s",
                                 self->tid_.to_string().c_str(),
                                 self->device_.c_str(),
                                 status.message.c_str());
            }
            self->finish_removal();
        });

    if (!queued) {
        op_in_flight_ = false;
        LOG_STAS_WARNING("%s | Worker pool unavailable, connection left in place.", tid_.to_string().c_str());
        finish_removal();
    }
}

void Controller::finish_removal() {
    device_.clear();
    set_state(ControllerState::Idle);
    if (observer_) {
        ControllerObserver* observer = observer_;
        const TransportId tid = tid_;
        context_.dispatcher.post([observer, tid]() { observer->controller_disposed(tid); });
    }
}

void Controller::enter_invalid(const std::string& reason) {
    if (!invalid_reported_) {
        LOG_STAS_ERROR("%s | Invalid controller: %s", tid_.to_string().c_str(), reason.c_str());
        invalid_reported_ = true;
    }
    set_state(ControllerState::Invalid);
}

void Controller::set_state(ControllerState state) {
    if (state == state_) {
        return;
    }
    const ControllerState previous = state_;
    state_ = state;
    LOG_STAS_DEBUG("%s | %s -> %s", tid_.to_string().c_str(), to_string(previous), to_string(state));
    if (observer_) {
        observer_->controller_state_changed(*this, previous, state);
    }
}

ControllerInfo Controller::info() const {
    ControllerInfo result = tid_.as_fields();
    result["state"] = to_string(state_);
    result["device"] = device_;
    result["connect-attempts"] = std::to_string(connect_attempts_);
    result["owned"] = owned_ ? "true" : "false";
    result["kind"] = tid_.is_discovery() ? "discovery" : "io";
    if (pending_removal_) {
        result["pending-removal"] = "true";
    }
    return result;
}

} // namespace engine
} // namespace nvmestas
