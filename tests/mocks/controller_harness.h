#pragma once
/**
 * Everything a controller or manager needs, wired for deterministic single-threaded
 * tests: manual clock, dispatcher driven with run_pending(), inline executor and the
 * scripted NVMe layer.
 */

#include <memory>
#include <string>
#include <vector>

#include "controllers/controller.h"
#include "dispatcher/dispatcher.h"
#include "mocks/inline_executor.h"
#include "mocks/manual_clock.h"
#include "mocks/mock_nvme_control.h"
#include "transport/discovery_log_entry.h"
#include "transport/transport_id.h"

namespace nvmestas {
namespace engine {
namespace testing {

inline TransportId make_tid(const std::string& transport,
                            const std::string& traddr,
                            const std::string& trsvcid,
                            const std::string& subsysnqn,
                            const std::string& host_iface = "") {
    TidFields fields{{"transport", transport}, {"traddr", traddr}, {"subsysnqn", subsysnqn}};
    if (!trsvcid.empty()) {
        fields["trsvcid"] = trsvcid;
    }
    if (!host_iface.empty()) {
        fields["host-iface"] = host_iface;
    }
    auto tid = parse_transport_id(fields);
    return tid ? *tid : TransportId();
}

inline TransportId make_dc_tid(const std::string& traddr, const std::string& host_iface = "") {
    return make_tid("tcp", traddr, "8009", kWellKnownDiscoveryNqn, host_iface).with_kind(ControllerKind::Discovery);
}

inline DiscoveryLogEntry make_dlpe(const std::string& subtype,
                                   const std::string& traddr,
                                   const std::string& subnqn,
                                   const std::string& trsvcid = "4420",
                                   uint16_t eflags = 0) {
    DiscoveryLogEntry entry;
    entry.trtype = "tcp";
    entry.adrfam = traddr.find(':') == std::string::npos ? "ipv4" : "ipv6";
    entry.subtype = subtype;
    entry.treq = "not specified";
    entry.portid = 1;
    entry.cntlid = 0xffff;
    entry.asqsz = 32;
    entry.eflags = eflags;
    entry.trsvcid = trsvcid;
    entry.subnqn = subnqn;
    entry.traddr = traddr;
    return entry;
}

class ControllerHarness {
public:
    ControllerHarness() : dispatcher(clock), context{dispatcher, executor, nvme, config} {
        config.host.nqn = "nqn.2014-08.org.nvmexpress:uuid:host-under-test";
        config.host.id = "00000000-0000-0000-0000-000000000001";
    }

    /** Delivers every queued completion and every due timer. */
    void settle() { dispatcher.run_pending(); }

    void advance(Clock::duration step) {
        clock.advance(step);
        settle();
    }

    ManualClock clock;
    Dispatcher dispatcher;
    InlineExecutor executor;
    MockNvmeControl nvme;
    config::StasConfig config;
    ControllerContext context;
};

} // namespace testing
} // namespace engine
} // namespace nvmestas
