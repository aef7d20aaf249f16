// src/configuration/config_loader.cpp
#include "config_loader.h"

#include <fstream>
#include <sstream>

#include "utils/stas_logger.h"
#include "utils/string_utils.h"
#include "utils/time_parse.h"

namespace nvmestas {
namespace config {

using engine::utils::lowercase_copy;
using engine::utils::parse_bool;
using engine::utils::parse_long;
using engine::utils::split_trimmed;
using engine::utils::starts_with;
using engine::utils::trim_copy;

namespace {

const char* kSectionGlobal = "global";
const char* kSectionServiceDiscovery = "service discovery";
const char* kSectionDcManagement = "discovery controller connection management";
const char* kSectionIocManagement = "i/o controller connection management";
const char* kSectionControllers = "controllers";
const char* kSectionHost = "host";

// Last occurrence wins for single-valued keys.
const std::string* last_value(const std::multimap<std::string, std::string>& section, const std::string& key) {
    auto range = section.equal_range(key);
    const std::string* found = nullptr;
    for (auto it = range.first; it != range.second; ++it) {
        found = &it->second;
    }
    return found;
}

std::optional<int> parse_int_field(const std::string& text) {
    auto value = parse_long(text);
    if (!value) {
        return std::nullopt;
    }
    return static_cast<int>(*value);
}

// Applies one connection knob. Returns false for an unparsable value, true otherwise
// (including keys that are not connection knobs).
bool apply_connection_key(ConnectionParams& params, const std::string& key, const std::string& value) {
    auto set_optional_int = [&value](std::optional<int>& target) {
        auto parsed = parse_int_field(value);
        if (!parsed) {
            return false;
        }
        target = *parsed;
        return true;
    };
    auto set_bool = [&value](bool& target) {
        auto parsed = parse_bool(value);
        if (!parsed) {
            return false;
        }
        target = *parsed;
        return true;
    };

    if (key == "kato") return set_optional_int(params.kato);
    if (key == "nr-io-queues") return set_optional_int(params.nr_io_queues);
    if (key == "nr-write-queues") return set_optional_int(params.nr_write_queues);
    if (key == "nr-poll-queues") return set_optional_int(params.nr_poll_queues);
    if (key == "queue-size") return set_optional_int(params.queue_size);
    if (key == "hdr-digest") return set_bool(params.hdr_digest);
    if (key == "data-digest") return set_bool(params.data_digest);
    if (key == "disable-sqflow") return set_bool(params.disable_sqflow);
    if (key == "reconnect-delay") {
        auto parsed = engine::utils::parse_duration(value);
        if (!parsed || parsed->count() <= 0) {
            return false;
        }
        params.reconnect_delay = static_cast<int>(parsed->count());
        return true;
    }
    if (key == "ctrl-loss-tmo") {
        auto parsed = engine::utils::parse_duration(value);
        if (!parsed || parsed->count() < -1) {
            return false;
        }
        params.ctrl_loss_tmo = static_cast<int>(parsed->count());
        return true;
    }
    if (key == "dhchap-secret") {
        params.dhchap_secret = value;
        return true;
    }
    if (key == "dhchap-ctrl-secret") {
        params.dhchap_ctrl_secret = value;
        return true;
    }
    return true;
}

bool is_connection_key(const std::string& key) {
    return key == "kato" || key == "nr-io-queues" || key == "nr-write-queues" || key == "nr-poll-queues" ||
           key == "queue-size" || key == "hdr-digest" || key == "data-digest" || key == "disable-sqflow" ||
           key == "reconnect-delay" || key == "ctrl-loss-tmo" || key == "dhchap-secret" ||
           key == "dhchap-ctrl-secret";
}

} // namespace

const char* to_string(DisconnectScope scope) {
    switch (scope) {
        case DisconnectScope::OnlyManaged: return "only-stas-connections";
        case DisconnectScope::AllMatchingTransportTypes: return "all-connections-matching-disconnect-trtypes";
        case DisconnectScope::NoDisconnect: return "no-disconnect";
    }
    return "unknown";
}

DisconnectScope parse_disconnect_scope(const std::string& text, bool* ok) {
    const std::string value = lowercase_copy(trim_copy(text));
    if (ok) *ok = true;
    if (value == "only-stas-connections" || value == "only-managed") {
        return DisconnectScope::OnlyManaged;
    }
    if (value == "all-connections-matching-disconnect-trtypes" || value == "all-matching-transport-types") {
        return DisconnectScope::AllMatchingTransportTypes;
    }
    if (value == "no-disconnect") {
        return DisconnectScope::NoDisconnect;
    }
    if (ok) *ok = false;
    return DisconnectScope::OnlyManaged;
}

std::optional<engine::TidFields> parse_controller_string(const std::string& text, std::string* error) {
    engine::TidFields fields;
    for (const auto& component : split_trimmed(text, ';')) {
        const auto eq = component.find('=');
        if (eq == std::string::npos || eq == 0) {
            if (error) *error = "malformed component \"" + component + "\"";
            return std::nullopt;
        }
        std::string key = lowercase_copy(trim_copy(component.substr(0, eq)));
        const std::string value = trim_copy(component.substr(eq + 1));
        if (key == "nqn") {
            key = "subsysnqn";
        }
        fields[key] = value;
    }
    if (fields.empty()) {
        if (error) *error = "empty controller string";
        return std::nullopt;
    }
    return fields;
}

ConnectionParams resolve_connection_params(const GlobalSettings& global,
                                           const engine::TidFields& overrides,
                                           bool discovery_controller) {
    ConnectionParams params = global.connection;
    for (const auto& kv : overrides) {
        if (!is_connection_key(kv.first)) {
            continue;
        }
        if (!apply_connection_key(params, kv.first, kv.second)) {
            LOG_STAS_WARNING("Ignoring invalid per-controller value %s=%s", kv.first.c_str(), kv.second.c_str());
        }
    }
    if (discovery_controller && !params.kato) {
        params.kato = kDcKatoDefault;
    }
    return params;
}

std::string resolve_host_value(const std::string& value) {
    const std::string trimmed = trim_copy(value);
    if (!starts_with(trimmed, "file://")) {
        return trimmed;
    }
    std::ifstream in(trimmed.substr(7));
    if (!in) {
        LOG_STAS_WARNING("Unable to read %s", trimmed.c_str());
        return "";
    }
    std::string line;
    std::getline(in, line);
    return trim_copy(line);
}

void ConfigLoader::warn(const std::string& message) {
    LOG_STAS_WARNING("%s", message.c_str());
    warnings_.push_back(message);
}

bool ConfigLoader::load_file(const std::string& path, StasConfig& out) {
    std::ifstream in(path);
    if (!in) {
        out = StasConfig();
        out.conf_file = path;
        warnings_.clear();
        warn("Unable to read " + path + ", using defaults");
        apply_host(nullptr, out);
        return false;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    const bool ok = load_string(buffer.str(), out);
    out.conf_file = path;
    return ok;
}

bool ConfigLoader::load_string(const std::string& text, StasConfig& out) {
    out = StasConfig();
    warnings_.clear();

    std::map<std::string, Section> sections;
    parse_ini(text, sections);

    for (const auto& entry : sections) {
        const std::string& name = entry.first;
        if (name == kSectionGlobal) {
            apply_global(entry.second, out);
        } else if (name == kSectionServiceDiscovery) {
            apply_service_discovery(entry.second, out);
        } else if (name == kSectionDcManagement) {
            apply_dc_management(entry.second, out);
        } else if (name == kSectionIocManagement) {
            apply_ioc_management(entry.second, out);
        } else if (name == kSectionControllers) {
            apply_controllers(entry.second, out);
        } else if (name != kSectionHost) {
            warn("Unknown section [" + name + "]");
        }
    }

    auto host_it = sections.find(kSectionHost);
    apply_host(host_it == sections.end() ? nullptr : &host_it->second, out);
    return true;
}

bool ConfigLoader::parse_ini(const std::string& text, std::map<std::string, Section>& sections) {
    std::istringstream in(text);
    std::string line;
    std::string current;
    int line_number = 0;
    bool have_section = false;

    while (std::getline(in, line)) {
        ++line_number;
        const std::string trimmed = trim_copy(line);
        if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
            continue;
        }
        if (trimmed.front() == '[') {
            if (trimmed.back() != ']') {
                warn("Line " + std::to_string(line_number) + ": malformed section header");
                have_section = false;
                continue;
            }
            current = lowercase_copy(trim_copy(trimmed.substr(1, trimmed.size() - 2)));
            sections[current];
            have_section = true;
            continue;
        }
        const auto eq = trimmed.find('=');
        if (eq == std::string::npos) {
            warn("Line " + std::to_string(line_number) + ": expected key=value");
            continue;
        }
        if (!have_section) {
            warn("Line " + std::to_string(line_number) + ": key outside of any section");
            continue;
        }
        const std::string key = lowercase_copy(trim_copy(trimmed.substr(0, eq)));
        const std::string value = trim_copy(trimmed.substr(eq + 1));
        sections[current].emplace(key, value);
    }
    return true;
}

void ConfigLoader::apply_global(const Section& section, StasConfig& out) {
    GlobalSettings& global = out.global;
    for (const auto& kv : section) {
        const std::string& key = kv.first;
        const std::string& value = kv.second;

        if (is_connection_key(key)) {
            if (!apply_connection_key(global.connection, key, value)) {
                warn("[Global] invalid value " + key + "=" + value);
            }
            continue;
        }

        std::optional<bool> flag;
        if (key == "tron" || key == "ignore-iface" || key == "pleo" ||
            key == "persistent-connections") {
            flag = parse_bool(value);
            if (!flag) {
                warn("[Global] invalid value " + key + "=" + value);
                continue;
            }
        }

        if (key == "tron") {
            global.tron = *flag;
        } else if (key == "ignore-iface") {
            global.ignore_iface = *flag;
        } else if (key == "pleo") {
            global.pleo_enabled = *flag;
        } else if (key == "persistent-connections") {
            // Older files carried this in [Global].
            out.dc_management.persistent_connections = *flag;
        } else if (key == "ip-family") {
            const std::string family = lowercase_copy(value);
            if (family == "ipv4") {
                global.ipv4_enabled = true;
                global.ipv6_enabled = false;
            } else if (family == "ipv6") {
                global.ipv4_enabled = false;
                global.ipv6_enabled = true;
            } else if (family == "ipv4+ipv6" || family == "ipv6+ipv4") {
                global.ipv4_enabled = true;
                global.ipv6_enabled = true;
            } else {
                warn("[Global] invalid value ip-family=" + value);
            }
        } else {
            warn("[Global] unknown key " + key);
        }
    }
}

void ConfigLoader::apply_service_discovery(const Section& section, StasConfig& out) {
    for (const auto& kv : section) {
        if (kv.first == "zeroconf") {
            auto flag = parse_bool(kv.second);
            if (flag) {
                out.service_discovery.zeroconf_enabled = *flag;
            } else {
                warn("[Service Discovery] invalid value zeroconf=" + kv.second);
            }
        } else {
            warn("[Service Discovery] unknown key " + kv.first);
        }
    }
}

void ConfigLoader::apply_dc_management(const Section& section, StasConfig& out) {
    for (const auto& kv : section) {
        if (kv.first == "persistent-connections") {
            auto flag = parse_bool(kv.second);
            if (flag) {
                out.dc_management.persistent_connections = *flag;
            } else {
                warn("[Discovery controller connection management] invalid value persistent-connections=" + kv.second);
            }
        } else if (kv.first == "zeroconf-connections-persistence") {
            auto duration = engine::utils::parse_duration(kv.second);
            if (duration) {
                out.dc_management.zeroconf_persistence = *duration;
            } else {
                warn("[Discovery controller connection management] invalid value zeroconf-connections-persistence=" +
                     kv.second);
            }
        } else {
            warn("[Discovery controller connection management] unknown key " + kv.first);
        }
    }
}

void ConfigLoader::apply_ioc_management(const Section& section, StasConfig& out) {
    IocManagementSettings& ioc = out.ioc_management;
    bool trtypes_seen = false;
    for (const auto& kv : section) {
        if (kv.first == "disconnect-scope") {
            bool ok = false;
            DisconnectScope scope = parse_disconnect_scope(kv.second, &ok);
            if (ok) {
                ioc.disconnect_scope = scope;
            } else {
                warn("[I/O controller connection management] invalid value disconnect-scope=" + kv.second);
            }
        } else if (kv.first == "disconnect-trtypes") {
            if (!trtypes_seen) {
                ioc.disconnect_trtypes.clear();
                trtypes_seen = true;
            }
            for (const auto& trtype : split_trimmed(kv.second, '+')) {
                const std::string normalized = lowercase_copy(trtype);
                if (normalized == "tcp" || normalized == "rdma" || normalized == "fc") {
                    ioc.disconnect_trtypes.insert(normalized);
                } else {
                    warn("[I/O controller connection management] invalid disconnect-trtypes entry " + trtype);
                }
            }
        } else if (kv.first == "connect-attempts-on-ncc") {
            auto value = parse_int_field(kv.second);
            if (value && *value >= 0) {
                ioc.connect_attempts_on_ncc = *value;
            } else {
                warn("[I/O controller connection management] invalid value connect-attempts-on-ncc=" + kv.second);
            }
        } else {
            warn("[I/O controller connection management] unknown key " + kv.first);
        }
    }
    if (trtypes_seen && ioc.disconnect_trtypes.empty()) {
        ioc.disconnect_trtypes.insert("tcp");
    }
}

void ConfigLoader::apply_controllers(const Section& section, StasConfig& out) {
    for (const auto& kv : section) {
        if (kv.first != "controller" && kv.first != "exclude") {
            warn("[Controllers] unknown key " + kv.first);
            continue;
        }
        std::string error;
        auto fields = parse_controller_string(kv.second, &error);
        if (!fields) {
            warn("[Controllers] " + kv.first + "=" + kv.second + ": " + error);
            continue;
        }
        if (kv.first == "controller") {
            out.controllers.push_back(std::move(*fields));
        } else {
            out.excludes.push_back(std::move(*fields));
        }
    }
}

void ConfigLoader::apply_host(const Section* section, StasConfig& out) {
    std::string nqn = std::string("file://") + kDefaultHostNqnFile;
    std::string id = std::string("file://") + kDefaultHostIdFile;
    std::string symname;
    if (section) {
        if (const std::string* value = last_value(*section, "nqn")) nqn = *value;
        if (const std::string* value = last_value(*section, "id")) id = *value;
        if (const std::string* value = last_value(*section, "symname")) symname = *value;
        for (const auto& kv : *section) {
            if (kv.first != "nqn" && kv.first != "id" && kv.first != "symname") {
                warn("[Host] unknown key " + kv.first);
            }
        }
    }
    out.host.nqn = resolve_host_value(nqn);
    out.host.id = resolve_host_value(id);
    out.host.symname = resolve_host_value(symname);
}

} // namespace config
} // namespace nvmestas
