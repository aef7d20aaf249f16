// src/configuration/config_loader.h
#ifndef STAS_CONFIG_LOADER_H
#define STAS_CONFIG_LOADER_H

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "stas_config_types.h"

namespace nvmestas {
namespace config {

/**
 * @brief Reads stasd.conf (INI syntax) into a StasConfig.
 * @details Keys may repeat; "controller=" and "exclude=" collect every occurrence.
 *          Unknown sections/keys and unparsable values are reported as warnings and
 *          leave the default in place. Host values of the form "file://<path>" are
 *          replaced by the first line of that file.
 */
class ConfigLoader {
public:
    ConfigLoader() = default;

    ConfigLoader(const ConfigLoader&) = delete;
    ConfigLoader& operator=(const ConfigLoader&) = delete;

    /**
     * @brief Loads a configuration file.
     * @param path The file to read.
     * @param out Receives the parsed configuration. Always reset to defaults first.
     * @return false if the file could not be read. `out` then holds defaults.
     */
    bool load_file(const std::string& path, StasConfig& out);

    /** @brief Same as load_file() for in-memory text. */
    bool load_string(const std::string& text, StasConfig& out);

    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    using Section = std::multimap<std::string, std::string>;

    bool parse_ini(const std::string& text, std::map<std::string, Section>& sections);
    void apply_global(const Section& section, StasConfig& out);
    void apply_service_discovery(const Section& section, StasConfig& out);
    void apply_dc_management(const Section& section, StasConfig& out);
    void apply_ioc_management(const Section& section, StasConfig& out);
    void apply_controllers(const Section& section, StasConfig& out);
    void apply_host(const Section* section, StasConfig& out);

    void warn(const std::string& message);

    std::vector<std::string> warnings_;
};

/**
 * @brief Parses "transport=tcp;traddr=10.0.0.1;nqn=..." into a field map.
 * @details "nqn" is stored as "subsysnqn". Keys are lower-cased, values trimmed.
 * @return std::nullopt if a component is not of the form key=value.
 */
std::optional<engine::TidFields> parse_controller_string(const std::string& text, std::string* error = nullptr);

/**
 * @brief Connection parameters for one controller.
 * @details Starts from [Global] and applies any per-controller overrides carried in the
 *          controller= string (kato, hdr-digest, reconnect-delay, ...). Discovery
 *          controllers without a configured kato get kDcKatoDefault.
 */
ConnectionParams resolve_connection_params(const GlobalSettings& global,
                                           const engine::TidFields& overrides,
                                           bool discovery_controller);

/** @brief "file://<path>" yields the first line of <path>; other values are returned trimmed. */
std::string resolve_host_value(const std::string& value);

DisconnectScope parse_disconnect_scope(const std::string& text, bool* ok = nullptr);

} // namespace config
} // namespace nvmestas

#endif // STAS_CONFIG_LOADER_H
