/**
 * @file nvme_control.h
 * @brief Interface to the low-level NVMe fabrics operations.
 * @details Every method blocks and may fail. The engine only ever calls them from a
 *          WorkerPool thread and never assumes more about a failure than whether it
 *          is worth retrying (ErrorKind::Transient) or not (ErrorKind::Permanent).
 */
#ifndef STAS_NVME_CONTROL_H
#define STAS_NVME_CONTROL_H

#include <optional>
#include <string>
#include <vector>

#include "configuration/stas_config_types.h"
#include "../transport/discovery_log_entry.h"
#include "../transport/transport_id.h"

namespace nvmestas {
namespace engine {

enum class ErrorKind {
    None,
    Transient,
    Permanent
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Transient: return "transient";
        case ErrorKind::Permanent: return "permanent";
    }
    return "unknown";
}

struct OpStatus {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    bool ok() const { return kind == ErrorKind::None; }

    static OpStatus success() { return OpStatus{}; }
    static OpStatus transient(std::string msg) { return OpStatus{ErrorKind::Transient, std::move(msg)}; }
    static OpStatus permanent(std::string msg) { return OpStatus{ErrorKind::Permanent, std::move(msg)}; }
};

struct ConnectResult {
    OpStatus status;
    std::string device;   // "nvme3"
    bool adopted = false; // an existing kernel connection was reused
};

struct LogPageResult {
    OpStatus status;
    std::vector<DiscoveryLogEntry> entries;
};

struct HostIdentity {
    std::string nqn;
    std::string id;
    std::string symname;
};

class NvmeControl {
public:
    virtual ~NvmeControl() = default;

    /** @brief Device name of a kernel connection matching `tid`, if any. */
    virtual std::optional<std::string> find_existing(const TransportId& tid) = 0;

    virtual ConnectResult connect(const TransportId& tid,
                                  const config::ConnectionParams& params,
                                  const HostIdentity& host) = 0;

    virtual OpStatus disconnect(const std::string& device) = 0;

    /**
     * @brief Discovery Log Page of a connected discovery controller.
     * @param port_local_only Ask for Port Local Entries Only. Ignored unless the DC is a
     *        direct discovery controller that supports it.
     */
    virtual LogPageResult get_log_page(const std::string& device, bool port_local_only) = 0;

    /** @brief Explicit registration (TP8010) with a discovery controller. */
    virtual OpStatus register_host(const std::string& device, const HostIdentity& host) = 0;
};

} // namespace engine
} // namespace nvmestas

#endif // STAS_NVME_CONTROL_H
