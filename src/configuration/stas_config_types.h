// src/configuration/stas_config_types.h
#ifndef STAS_CONFIG_TYPES_H
#define STAS_CONFIG_TYPES_H

#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "transport/transport_id.h" // For engine::TidFields

namespace nvmestas {
namespace config {

inline constexpr const char* kDefaultConfFile = "/etc/stas/stasd.conf";
inline constexpr const char* kDefaultStateDir = "/run/stasd";
inline constexpr const char* kDefaultHostNqnFile = "/etc/nvme/hostnqn";
inline constexpr const char* kDefaultHostIdFile = "/etc/nvme/hostid";
inline constexpr int kDcKatoDefault = 30; // seconds, persistent DC connections must carry a KATO

enum class DisconnectScope {
    OnlyManaged,                 // "only-stas-connections"
    AllMatchingTransportTypes,   // "all-connections-matching-disconnect-trtypes"
    NoDisconnect                 // "no-disconnect"
};

const char* to_string(DisconnectScope scope);

// Per-connection knobs. Unset optionals leave the kernel default in place.
struct ConnectionParams {
    std::optional<int> kato;
    std::optional<int> nr_io_queues;
    std::optional<int> nr_write_queues;
    std::optional<int> nr_poll_queues;
    std::optional<int> queue_size;
    bool hdr_digest = false;
    bool data_digest = false;
    bool disable_sqflow = false;
    int reconnect_delay = 10;   // seconds between connect attempts
    int ctrl_loss_tmo = -1;     // -1: retry forever, 0: never retry, N: give up after N seconds
    std::string dhchap_secret;
    std::string dhchap_ctrl_secret;
};

struct GlobalSettings {
    bool tron = false;
    bool ignore_iface = false;
    bool ipv4_enabled = true;
    bool ipv6_enabled = true;
    bool pleo_enabled = true;   // Port Local Entries Only on Get Log Page
    ConnectionParams connection;
};

struct ServiceDiscoverySettings {
    bool zeroconf_enabled = true;
};

struct DcManagementSettings {
    bool persistent_connections = true;
    std::chrono::seconds zeroconf_persistence{72 * 3600};
};

struct IocManagementSettings {
    DisconnectScope disconnect_scope = DisconnectScope::OnlyManaged;
    std::set<std::string> disconnect_trtypes{"tcp"};
    int connect_attempts_on_ncc = 0;   // 0 disables NCC give-up

    // Values 1 and up are raised to 2 so the fast retry gets a chance.
    int effective_connect_attempts_on_ncc() const {
        if (connect_attempts_on_ncc <= 0) {
            return 0;
        }
        return connect_attempts_on_ncc < 2 ? 2 : connect_attempts_on_ncc;
    }
};

struct HostSettings {
    std::string nqn;
    std::string id;
    std::string symname;
};

// Everything read from stasd.conf. Built once at startup (and again on reload)
// and handed to the engine by reference.
struct StasConfig {
    std::string conf_file;
    std::string state_dir = kDefaultStateDir;
    GlobalSettings global;
    ServiceDiscoverySettings service_discovery;
    DcManagementSettings dc_management;
    IocManagementSettings ioc_management;
    HostSettings host;
    std::vector<engine::TidFields> controllers;  // [Controllers] controller=
    std::vector<engine::TidFields> excludes;     // [Controllers] exclude=
};

} // namespace config
} // namespace nvmestas

#endif // STAS_CONFIG_TYPES_H
