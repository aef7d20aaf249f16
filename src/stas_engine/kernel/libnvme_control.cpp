#include "libnvme_control.h"

#include <endian.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include "../utils/stas_logger.h"

namespace nvmestas {
namespace engine {

namespace {

constexpr int kGenctrRetries = 3;
constexpr uint32_t kAdminTimeoutMs = 0;   // 0: kernel default

class ScopedNvmeCtrl {
public:
    explicit ScopedNvmeCtrl(nvme_ctrl_t ctrl) : ctrl_(ctrl) {}
    ~ScopedNvmeCtrl() {
        if (ctrl_) {
            nvme_free_ctrl(ctrl_);
        }
    }
    ScopedNvmeCtrl(const ScopedNvmeCtrl&) = delete;
    ScopedNvmeCtrl& operator=(const ScopedNvmeCtrl&) = delete;
    nvme_ctrl_t get() const { return ctrl_; }

private:
    nvme_ctrl_t ctrl_;
};

const char* optional_arg(const std::string& value) {
    return value.empty() ? nullptr : value.c_str();
}

std::string errno_text(int err) {
    return std::string(nvme_errno_to_string(err)) + " (" + std::to_string(err) + ")";
}

// Connect failures libnvme or the driver will keep reporting no matter how often we retry.
bool is_permanent_connect_error(int err) {
    switch (err) {
        case ENVME_CONNECT_TARG:
        case ENVME_CONNECT_AARG:
        case ENVME_CONNECT_INVAL_TR:
        case ENVME_CONNECT_INVAL:
        case EINVAL:
        case EPROTONOSUPPORT:
        case EOPNOTSUPP:
            return true;
        default:
            return false;
    }
}

// Fabrics pads NQNs with NULs and addresses with spaces.
std::string fixed_field(const char* data, std::size_t len) {
    std::size_t end = 0;
    while (end < len && data[end] != '\0') {
        ++end;
    }
    while (end > 0 && data[end - 1] == ' ') {
        --end;
    }
    return std::string(data, end);
}

std::string subtype_name(uint8_t subtype) {
    switch (subtype) {
        case NVME_NQN_DISC: return "referral";
        case NVME_NQN_NVME: return "nvme";
        case NVME_NQN_CURR: return "discovery";
        default: return "unrecognized";
    }
}

bool is_central_dc(nvme_ctrl_t ctrl) {
    const char* dctype = nvme_ctrl_get_dctype(ctrl);
    return dctype && std::strcmp(dctype, "cdc") == 0;
}

// Port Local Entries Only is only honoured by DCs that advertise it for LID 0x70.
bool supports_pleo(nvme_ctrl_t ctrl) {
    const int fd = nvme_ctrl_get_fd(ctrl);
    if (fd < 0) {
        return false;
    }
    struct nvme_supported_log_pages supported;
    std::memset(&supported, 0, sizeof(supported));
    if (nvme_get_log_supported_log_pages(fd, false, &supported) != 0) {
        LOG_STAS_DEBUG("%s - Get Supported Log Pages failed, reading without PLEO.", nvme_ctrl_get_name(ctrl));
        return false;
    }
    const uint32_t options = le32toh(supported.lid_support[NVME_LOG_LID_DISCOVER]) >> 16;
    return (options & NVMF_LOG_DISC_LID_PLEOS) != 0;
}

} // namespace

DiscoveryLogEntry to_discovery_log_entry(const struct nvmf_disc_log_entry& raw) {
    DiscoveryLogEntry entry;
    entry.trtype = nvmf_trtype_str(raw.trtype);
    entry.adrfam = nvmf_adrfam_str(raw.adrfam);
    entry.subtype = subtype_name(raw.subtype);
    entry.treq = nvmf_treq_str(raw.treq & (NVMF_TREQ_REQUIRED | NVMF_TREQ_NOT_REQUIRED));
    entry.portid = le16toh(raw.portid);
    entry.cntlid = le16toh(raw.cntlid);
    entry.asqsz = le16toh(raw.asqsz);
    entry.eflags = le16toh(raw.eflags);
    entry.trsvcid = fixed_field(raw.trsvcid, sizeof(raw.trsvcid));
    entry.subnqn = fixed_field(raw.subnqn, sizeof(raw.subnqn));
    entry.traddr = fixed_field(raw.traddr, sizeof(raw.traddr));
    return entry;
}

std::vector<DiscoveryLogEntry> discovery_log_entries(const struct nvmf_discovery_log& log) {
    const uint64_t numrec = le64toh(log.numrec);
    std::vector<DiscoveryLogEntry> entries;
    entries.reserve(static_cast<std::size_t>(numrec));
    for (uint64_t i = 0; i < numrec; ++i) {
        entries.push_back(to_discovery_log_entry(log.entries[i]));
    }
    return entries;
}

struct nvme_fabrics_config LibnvmeControl::fabrics_config(const config::ConnectionParams& params) {
    struct nvme_fabrics_config cfg;
    nvmf_default_config(&cfg);
    if (params.kato) {
        cfg.keep_alive_tmo = *params.kato;
    }
    if (params.nr_io_queues) {
        cfg.nr_io_queues = *params.nr_io_queues;
    }
    if (params.nr_write_queues) {
        cfg.nr_write_queues = *params.nr_write_queues;
    }
    if (params.nr_poll_queues) {
        cfg.nr_poll_queues = *params.nr_poll_queues;
    }
    if (params.queue_size) {
        cfg.queue_size = *params.queue_size;
    }
    cfg.reconnect_delay = params.reconnect_delay;
    cfg.ctrl_loss_tmo = params.ctrl_loss_tmo;
    cfg.disable_sqflow = params.disable_sqflow;
    cfg.hdr_digest = params.hdr_digest;
    cfg.data_digest = params.data_digest;
    return cfg;
}

std::optional<std::string> LibnvmeControl::find_existing(const TransportId& tid) {
    for (const auto& entry : inventory_.snapshot()) {
        auto existing = parse_transport_id(entry.fields);
        if (!existing) {
            continue;
        }
        if (entry.looks_like_discovery_controller()) {
            existing = existing->with_kind(ControllerKind::Discovery);
        }
        if (TransportId::matches(*existing, tid)) {
            return entry.device;
        }
    }
    return std::nullopt;
}

ConnectResult LibnvmeControl::connect(const TransportId& tid,
                                      const config::ConnectionParams& params,
                                      const HostIdentity& host) {
    ConnectResult result;
    ScopedNvmeRoot root;
    if (!root) {
        result.status = OpStatus::transient("cannot scan the nvme topology: " + errno_text(errno));
        return result;
    }

    const std::string host_nqn = tid.host_nqn().empty() ? host.nqn : tid.host_nqn();
    const std::string host_id = tid.host_id().empty() ? host.id : tid.host_id();
    nvme_host_t nvme_host = nvme_lookup_host(root.get(), host_nqn.c_str(), optional_arg(host_id));
    if (!nvme_host) {
        result.status = OpStatus::transient("cannot set up host " + host_nqn);
        return result;
    }
    if (!params.dhchap_secret.empty()) {
        nvme_host_set_dhchap_key(nvme_host, params.dhchap_secret.c_str());
    }

    const std::string subsysnqn = tid.subsysnqn().empty() ? std::string(kWellKnownDiscoveryNqn) : tid.subsysnqn();
    ScopedNvmeCtrl ctrl(nvme_create_ctrl(root.get(),
                                         subsysnqn.c_str(),
                                         tid.transport().c_str(),
                                         optional_arg(tid.traddr()),
                                         optional_arg(tid.host_traddr()),
                                         optional_arg(tid.host_iface()),
                                         optional_arg(tid.trsvcid())));
    if (!ctrl.get()) {
        const int err = errno;
        std::string message = "cannot create controller: " + errno_text(err);
        result.status = err == EINVAL ? OpStatus::permanent(message) : OpStatus::transient(message);
        return result;
    }
    if (!params.dhchap_ctrl_secret.empty()) {
        nvme_ctrl_set_dhchap_key(ctrl.get(), params.dhchap_ctrl_secret.c_str());
    }
    // A unique (TP8013) discovery NQN does not tell the driver it is a DC.
    if (tid.is_discovery() && subsysnqn != kWellKnownDiscoveryNqn) {
        nvme_ctrl_set_discovery_ctrl(ctrl.get(), true);
    }

    struct nvme_fabrics_config cfg = fabrics_config(params);
    if (nvmf_add_ctrl(nvme_host, ctrl.get(), &cfg) < 0) {
        const int err = errno;
        if (err == ENVME_CONNECT_ALREADY) {
            if (auto device = find_existing(tid)) {
                result.device = *device;
                result.adopted = true;
                return result;
            }
        }
        std::string message = "connect failed: " + errno_text(err);
        result.status = is_permanent_connect_error(err) ? OpStatus::permanent(message)
                                                        : OpStatus::transient(message);
        return result;
    }

    const char* name = nvme_ctrl_get_name(ctrl.get());
    if (!name || !*name) {
        result.status = OpStatus::transient("connected, but the kernel returned no device name");
        return result;
    }
    result.device = name;
    return result;
}

OpStatus LibnvmeControl::disconnect(const std::string& device) {
    ScopedNvmeRoot root;
    if (!root) {
        return OpStatus::transient("cannot scan the nvme topology: " + errno_text(errno));
    }
    nvme_ctrl_t ctrl = find_controller(root.get(), device);
    if (!ctrl) {
        return OpStatus::success();
    }
    if (nvme_disconnect_ctrl(ctrl) != 0) {
        const int err = errno;
        if (err == ENOENT || err == ENODEV) {
            return OpStatus::success();
        }
        return OpStatus::transient("disconnect failed: " + errno_text(err));
    }
    return OpStatus::success();
}

LogPageResult LibnvmeControl::get_log_page(const std::string& device, bool port_local_only) {
    LogPageResult result;
    ScopedNvmeRoot root;
    if (!root) {
        result.status = OpStatus::transient("cannot scan the nvme topology: " + errno_text(errno));
        return result;
    }
    nvme_ctrl_t ctrl = find_controller(root.get(), device);
    if (!ctrl) {
        result.status = OpStatus::transient(device + " no longer exists");
        return result;
    }

    uint8_t lsp = NVMF_LOG_DISC_LSP_NONE;
    if (port_local_only && !is_central_dc(ctrl) && supports_pleo(ctrl)) {
        lsp = NVMF_LOG_DISC_LSP_PLEO;
    }

    struct nvme_get_discovery_args args;
    std::memset(&args, 0, sizeof(args));
    args.c = ctrl;
    args.args_size = sizeof(args);
    args.max_retries = kGenctrRetries;
    args.result = nullptr;
    args.timeout = kAdminTimeoutMs;
    args.lsp = lsp;

    // libnvme re-reads the page while its generation counter moves.
    struct nvmf_discovery_log* log = nvmf_get_discovery_wargs(&args);
    if (!log) {
        result.status = OpStatus::transient("Get Log Page failed: " + errno_text(errno));
        return result;
    }
    result.entries = discovery_log_entries(*log);
    std::free(log);
    return result;
}

OpStatus LibnvmeControl::register_host(const std::string& device, const HostIdentity& host) {
    ScopedNvmeRoot root;
    if (!root) {
        return OpStatus::transient("cannot scan the nvme topology: " + errno_text(errno));
    }
    nvme_ctrl_t ctrl = find_controller(root.get(), device);
    if (!ctrl) {
        return OpStatus::transient(device + " no longer exists");
    }
    if (!nvmf_is_registration_supported(ctrl)) {
        LOG_STAS_DEBUG("%s - Explicit registration not supported, skipped.", device.c_str());
        return OpStatus::success();
    }

    nvme_host_t nvme_host = nvme_subsystem_get_host(nvme_ctrl_get_subsystem(ctrl));
    if (nvme_host && !host.symname.empty()) {
        nvme_host_set_hostsymname(nvme_host, host.symname.c_str());
    }

    uint32_t status = 0;
    const int rc = nvmf_register_ctrl(ctrl, NVMF_DIM_TAS_REGISTER, &status);
    if (rc < 0) {
        return OpStatus::transient("registration failed: " + errno_text(errno));
    }
    if (rc > 0) {
        return OpStatus::transient("registration failed with NVMe status " + std::to_string(rc));
    }
    return OpStatus::success();
}

} // namespace engine
} // namespace nvmestas
