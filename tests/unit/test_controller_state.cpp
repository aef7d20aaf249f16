#include <gtest/gtest.h>
#include <memory>

#include "controllers/controller.h"
#include "mocks/controller_harness.h"
#include "mocks/recording_observer.h"

using namespace nvmestas::engine;
using namespace nvmestas::engine::testing;
using namespace std::chrono_literals;
using nvmestas::config::ConnectionParams;

namespace {

DeviceEvent remove_event(const std::string& device) {
    DeviceEvent event;
    event.action = "remove";
    event.device = device;
    event.properties["SUBSYSTEM"] = "nvme";
    return event;
}

} // namespace

class ControllerStateTest : public ::testing::Test {
protected:
    std::shared_ptr<Controller> make_controller(ConnectionParams params = ConnectionParams()) {
        return std::make_shared<Controller>(harness.context, tid, params, &observer);
    }

    ConnectionParams params_with(int reconnect_delay, int ctrl_loss_tmo) {
        ConnectionParams params;
        params.reconnect_delay = reconnect_delay;
        params.ctrl_loss_tmo = ctrl_loss_tmo;
        return params;
    }

    ControllerHarness harness;
    RecordingObserver observer;
    TransportId tid = make_tid("tcp", "10.0.0.1", "4420", "nqn.io-1").with_kind(ControllerKind::Io);
};

TEST_F(ControllerStateTest, ConnectsOnStart) {
    auto controller = make_controller();
    EXPECT_EQ(controller->state(), ControllerState::Idle);

    controller->start();
    EXPECT_EQ(controller->state(), ControllerState::Connecting);
    EXPECT_TRUE(controller->operation_in_flight());

    harness.settle();
    EXPECT_EQ(controller->state(), ControllerState::Connected);
    EXPECT_EQ(controller->device(), "nvme0");
    EXPECT_EQ(controller->connect_attempts(), 0);
    EXPECT_FALSE(controller->operation_in_flight());
    EXPECT_EQ(harness.nvme.connect_calls(), 1);
    EXPECT_EQ(observer.states(),
              (std::vector<ControllerState>{ControllerState::Connecting, ControllerState::Connected}));
}

TEST_F(ControllerStateTest, ConnectUsesHostIdentityAndParams) {
    auto controller = make_controller(params_with(7, 600));
    controller->start();
    harness.settle();

    auto connections = harness.nvme.connections();
    ASSERT_EQ(connections.size(), 1u);
    EXPECT_EQ(connections.begin()->second.host_nqn, harness.config.host.nqn);
    EXPECT_EQ(harness.nvme.last_params().reconnect_delay, 7);
    EXPECT_EQ(harness.nvme.last_params().ctrl_loss_tmo, 600);
}

TEST_F(ControllerStateTest, AdoptsExistingConnection) {
    const std::string device = harness.nvme.add_connection(tid, harness.config.host.nqn);

    auto controller = make_controller();
    controller->start();
    harness.settle();

    EXPECT_EQ(controller->state(), ControllerState::Connected);
    EXPECT_EQ(controller->device(), device);
    EXPECT_EQ(harness.nvme.connect_calls(), 0);
    EXPECT_EQ(harness.nvme.connection_count(), 1u);
}

TEST_F(ControllerStateTest, StartIsIgnoredUnlessIdle) {
    auto controller = make_controller();
    controller->start();
    harness.settle();
    controller->start();
    harness.settle();
    EXPECT_EQ(harness.nvme.connect_calls(), 1);
}

TEST_F(ControllerStateTest, RetryBoundedByCtrlLossTmo) {
    harness.nvme.set_default_connect_status(OpStatus::transient("connection refused"));
    auto controller = make_controller(params_with(5, 20));

    controller->start();
    harness.settle();
    EXPECT_EQ(controller->state(), ControllerState::RetryWait);
    EXPECT_EQ(controller->connect_attempts(), 1);
    ASSERT_TRUE(controller->failing_since().has_value());

    // Attempts at t=5, 10 and 15 keep failing within the window.
    for (int i = 0; i < 3; ++i) {
        harness.advance(4s);
        EXPECT_EQ(harness.nvme.connect_calls(), i + 1);
        harness.advance(1s);
        EXPECT_EQ(controller->state(), ControllerState::RetryWait);
    }
    EXPECT_EQ(controller->connect_attempts(), 4);

    // t=20: the failure window reached ctrl-loss-tmo.
    harness.advance(5s);
    EXPECT_EQ(controller->state(), ControllerState::Failed);
    EXPECT_EQ(controller->connect_attempts(), 5);

    harness.advance(10min);
    EXPECT_EQ(harness.nvme.connect_calls(), 5);
    EXPECT_EQ(controller->state(), ControllerState::Failed);
}

TEST_F(ControllerStateTest, ZeroCtrlLossTmoNeverRetries) {
    harness.nvme.set_default_connect_status(OpStatus::transient("no route to host"));
    auto controller = make_controller(params_with(5, 0));

    controller->start();
    harness.settle();
    EXPECT_EQ(controller->state(), ControllerState::Failed);

    harness.advance(1min);
    EXPECT_EQ(harness.nvme.connect_calls(), 1);
}

TEST_F(ControllerStateTest, NegativeCtrlLossTmoRetriesForever) {
    harness.nvme.set_default_connect_status(OpStatus::transient("timed out"));
    auto controller = make_controller(params_with(10, -1));

    controller->start();
    harness.settle();
    for (int i = 0; i < 50; ++i) {
        harness.advance(10s);
    }
    EXPECT_EQ(controller->state(), ControllerState::RetryWait);
    EXPECT_EQ(harness.nvme.connect_calls(), 51);
}

TEST_F(ControllerStateTest, SuccessAfterFailuresResetsCounters) {
    harness.nvme.script_connect(OpStatus::transient("refused"));
    harness.nvme.script_connect(OpStatus::transient("refused"));
    auto controller = make_controller(params_with(5, 60));

    controller->start();
    harness.settle();
    harness.advance(5s);
    EXPECT_EQ(controller->connect_attempts(), 2);

    harness.advance(5s);
    EXPECT_EQ(controller->state(), ControllerState::Connected);
    EXPECT_EQ(controller->connect_attempts(), 0);
    EXPECT_FALSE(controller->failing_since().has_value());
}

TEST_F(ControllerStateTest, PermanentErrorIsInvalid) {
    harness.nvme.script_connect(OpStatus::permanent("invalid argument"));
    auto controller = make_controller(params_with(5, -1));

    controller->start();
    harness.settle();
    EXPECT_EQ(controller->state(), ControllerState::Invalid);

    harness.advance(1min);
    EXPECT_EQ(harness.nvme.connect_calls(), 1);
}

TEST_F(ControllerStateTest, MissingHostNqnIsInvalid) {
    harness.config.host.nqn.clear();
    auto controller = make_controller();
    controller->start();
    harness.settle();

    EXPECT_EQ(controller->state(), ControllerState::Invalid);
    EXPECT_EQ(harness.nvme.connect_calls(), 0);
}

TEST_F(ControllerStateTest, EmptyTidIsInvalid) {
    auto controller = std::make_shared<Controller>(harness.context, TransportId(), ConnectionParams(), &observer);
    controller->start();
    EXPECT_EQ(controller->state(), ControllerState::Invalid);
    EXPECT_EQ(harness.executor.submitted(), 0u);
}

TEST_F(ControllerStateTest, KernelRemovalUsesFastRetry) {
    auto controller = make_controller(params_with(30, -1));
    controller->start();
    harness.settle();
    const std::string first_device = controller->device();

    harness.nvme.drop_connection(first_device);
    controller->on_device_event(remove_event(first_device));
    EXPECT_EQ(controller->state(), ControllerState::RetryWait);
    EXPECT_TRUE(controller->device().empty());
    EXPECT_EQ(controller->connect_attempts(), 0);

    harness.advance(kFastRetryPeriod - 1s);
    EXPECT_EQ(controller->state(), ControllerState::RetryWait);

    harness.advance(1s);
    EXPECT_EQ(controller->state(), ControllerState::Connected);
    EXPECT_NE(controller->device(), first_device);
    EXPECT_EQ(harness.nvme.connect_calls(), 2);
}

TEST_F(ControllerStateTest, EventsForOtherDevicesAreIgnored) {
    auto controller = make_controller();
    controller->start();
    harness.settle();

    controller->on_device_event(remove_event("nvme99"));
    EXPECT_EQ(controller->state(), ControllerState::Connected);
}

TEST_F(ControllerStateTest, RemoveDisconnectsAndDisposes) {
    auto controller = make_controller();
    controller->start();
    harness.settle();
    const std::string device = controller->device();

    controller->remove(false);
    harness.settle();

    EXPECT_EQ(controller->state(), ControllerState::Idle);
    EXPECT_TRUE(observer.entered(ControllerState::Disconnecting));
    EXPECT_EQ(harness.nvme.disconnected(), (std::vector<std::string>{device}));
    ASSERT_EQ(observer.disposed.size(), 1u);
    EXPECT_EQ(observer.disposed[0], tid);

    // Terminal: start() does nothing after removal.
    controller->start();
    EXPECT_EQ(controller->state(), ControllerState::Idle);
}

TEST_F(ControllerStateTest, RemoveWithKeepConnectionLeavesKernelAlone) {
    auto controller = make_controller();
    controller->start();
    harness.settle();

    controller->remove(true);
    harness.settle();

    EXPECT_EQ(controller->state(), ControllerState::Idle);
    EXPECT_TRUE(harness.nvme.disconnected().empty());
    EXPECT_EQ(harness.nvme.connection_count(), 1u);
    EXPECT_EQ(observer.disposed.size(), 1u);
}

TEST_F(ControllerStateTest, RemoveDuringRetryWaitCancelsTimer) {
    harness.nvme.set_default_connect_status(OpStatus::transient("refused"));
    auto controller = make_controller(params_with(5, -1));
    controller->start();
    harness.settle();
    ASSERT_EQ(controller->state(), ControllerState::RetryWait);

    controller->remove(false);
    harness.settle();
    EXPECT_EQ(controller->state(), ControllerState::Idle);
    EXPECT_TRUE(harness.nvme.disconnected().empty());

    harness.advance(1min);
    EXPECT_EQ(harness.nvme.connect_calls(), 1);
}

TEST_F(ControllerStateTest, RemoveTwiceIsHarmless) {
    auto controller = make_controller();
    controller->start();
    harness.settle();
    controller->remove(false);
    controller->remove(false);
    harness.settle();
    EXPECT_EQ(harness.nvme.disconnected().size(), 1u);
    EXPECT_EQ(observer.disposed.size(), 1u);
}

TEST_F(ControllerStateTest, RefusedExecutorCountsAsTransientFailure) {
    harness.executor.set_refuse(true);
    auto controller = make_controller(params_with(5, -1));
    controller->start();
    EXPECT_EQ(controller->state(), ControllerState::RetryWait);
    EXPECT_EQ(controller->connect_attempts(), 1);

    harness.executor.set_refuse(false);
    harness.advance(5s);
    EXPECT_EQ(controller->state(), ControllerState::Connected);
}

TEST_F(ControllerStateTest, InfoDescribesController) {
    auto controller = make_controller();
    controller->set_owned(true);
    controller->start();
    harness.settle();

    auto info = controller->info();
    EXPECT_EQ(info.at("state"), "connected");
    EXPECT_EQ(info.at("device"), "nvme0");
    EXPECT_EQ(info.at("traddr"), "10.0.0.1");
    EXPECT_EQ(info.at("subsysnqn"), "nqn.io-1");
    EXPECT_EQ(info.at("owned"), "true");
    EXPECT_EQ(info.at("kind"), "io");
    EXPECT_EQ(info.count("pending-removal"), 0u);
}

TEST(ControllerStateNames, AllStatesHaveNames) {
    EXPECT_STREQ(to_string(ControllerState::Idle), "idle");
    EXPECT_STREQ(to_string(ControllerState::RetryWait), "retry-wait");
    EXPECT_STREQ(to_string(ControllerState::Suspended), "suspended");
    EXPECT_STREQ(to_string(ControllerState::Invalid), "invalid");
}

// Blocking calls held in a ManualExecutor so that removal can race an in-flight connect.
class PendingRemovalTest : public ::testing::Test {
protected:
    PendingRemovalTest() : dispatcher(clock), context{dispatcher, executor, nvme, config} {
        config.host.nqn = "nqn.2014-08.org.nvmexpress:uuid:host-under-test";
    }

    void drain() {
        while (executor.run_all() > 0 || dispatcher.run_pending() > 0) {
        }
    }

    ManualClock clock;
    Dispatcher dispatcher;
    ManualExecutor executor;
    MockNvmeControl nvme;
    nvmestas::config::StasConfig config;
    ControllerContext context;
    RecordingObserver observer;
    TransportId tid = make_tid("tcp", "10.0.0.1", "4420", "nqn.io-1").with_kind(ControllerKind::Io);
};

TEST_F(PendingRemovalTest, RemovalWaitsForInFlightConnect) {
    auto controller = std::make_shared<Controller>(context, tid, ConnectionParams(), &observer);
    controller->start();
    ASSERT_EQ(executor.pending(), 1u);

    controller->remove(false);
    EXPECT_TRUE(controller->pending_removal());
    EXPECT_EQ(controller->state(), ControllerState::Connecting);
    EXPECT_TRUE(observer.disposed.empty());

    // The connect completes, then the controller disconnects what it just got.
    executor.run_all();
    dispatcher.run_pending();
    EXPECT_FALSE(controller->pending_removal());
    EXPECT_EQ(controller->state(), ControllerState::Disconnecting);
    EXPECT_EQ(executor.pending(), 1u);

    drain();
    EXPECT_EQ(controller->state(), ControllerState::Idle);
    EXPECT_EQ(nvme.disconnected(), (std::vector<std::string>{"nvme0"}));
    EXPECT_EQ(nvme.connection_count(), 0u);
    EXPECT_EQ(observer.disposed.size(), 1u);
    EXPECT_FALSE(observer.entered(ControllerState::Connected));
}

TEST_F(PendingRemovalTest, RemovalWithKeepConnectionAfterInFlightConnect) {
    auto controller = std::make_shared<Controller>(context, tid, ConnectionParams(), &observer);
    controller->start();
    controller->remove(true);
    drain();

    EXPECT_EQ(controller->state(), ControllerState::Idle);
    EXPECT_TRUE(nvme.disconnected().empty());
    EXPECT_EQ(nvme.connection_count(), 1u);
    EXPECT_EQ(observer.disposed.size(), 1u);
}

TEST_F(PendingRemovalTest, FailedConnectStillCompletesRemoval) {
    nvme.script_connect(OpStatus::transient("refused"));
    auto controller = std::make_shared<Controller>(context, tid, ConnectionParams(), &observer);
    controller->start();
    controller->remove(false);
    drain();

    EXPECT_EQ(controller->state(), ControllerState::Idle);
    EXPECT_TRUE(nvme.disconnected().empty());
    EXPECT_EQ(observer.disposed.size(), 1u);
    EXPECT_FALSE(observer.entered(ControllerState::RetryWait));
}

TEST_F(PendingRemovalTest, DestroyedControllerIgnoresLateCompletion) {
    auto controller = std::make_shared<Controller>(context, tid, ConnectionParams(), &observer);
    controller->start();
    controller.reset();

    drain();
    EXPECT_TRUE(observer.disposed.empty());
    // The connection was made but nobody owns it any more.
    EXPECT_EQ(nvme.connection_count(), 1u);
}
