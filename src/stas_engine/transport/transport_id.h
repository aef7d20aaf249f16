/**
 * @file transport_id.h
 * @brief Defines the Transport Identifier (TID), the identity key of every controller connection.
 * @details A TID is an immutable value object. Its strict ordering (`operator<`) makes it
 *          usable as a map key, while `TransportId::matches()` implements the relaxed
 *          relation used whenever a connection known to the kernel must be paired with
 *          one the engine wants:
 *          - host-iface is compared only when both sides carry one, so a connection made
 *            outside of the daemon (no interface recorded) still pairs with a configured
 *            TID that names an interface;
 *          - host-nqn and host-id are compared only when both sides carry one;
 *          - the well-known discovery NQN stands for any discovery controller, so it
 *            pairs with the unique (TP8013) NQN a discovery controller may advertise.
 *            Two different unique NQNs never pair.
 */
#ifndef STAS_TRANSPORT_ID_H
#define STAS_TRANSPORT_ID_H

#include <map>
#include <optional>
#include <string>

namespace nvmestas {
namespace engine {

inline constexpr const char* kWellKnownDiscoveryNqn = "nqn.2014-08.org.nvmexpress.discovery";
inline constexpr const char* kRdmaDefaultPort = "4420";
inline constexpr const char* kDiscoveryDefaultPort = "8009";

/** @brief Field map used by configuration strings, persistence and kernel attributes. */
using TidFields = std::map<std::string, std::string>;

/** @brief What the engine knows about the kind of controller a TID points at. */
enum class ControllerKind {
    Unknown,
    Discovery,
    Io
};

class TransportId;

/**
 * @brief Builds a TID from a field map.
 * @details Recognized keys: transport, traddr, trsvcid, subsysnqn (alias "nqn"),
 *          host-traddr, host-iface, host-nqn, host-id. Other keys are ignored here;
 *          connection parameters travel separately. tcp and rdma get their default
 *          trsvcid (8009 / 4420) when none is given; fc and loop never carry one.
 * @param error Receives a description of the problem on failure (may be null).
 * @return std::nullopt when transport or traddr is missing or the transport is unknown.
 */
std::optional<TransportId> parse_transport_id(const TidFields& fields, std::string* error = nullptr);

class TransportId {
public:
    TransportId() = default;

    const std::string& transport() const { return transport_; }
    const std::string& traddr() const { return traddr_; }
    const std::string& trsvcid() const { return trsvcid_; }
    const std::string& subsysnqn() const { return subsysnqn_; }
    const std::string& host_traddr() const { return host_traddr_; }
    const std::string& host_iface() const { return host_iface_; }
    const std::string& host_nqn() const { return host_nqn_; }
    const std::string& host_id() const { return host_id_; }
    ControllerKind kind() const { return kind_; }

    /** @brief True for the well-known discovery NQN or a TID built for a discovery controller. */
    bool is_discovery() const;

    /** @brief Copy with the controller kind hint replaced. Identity is unchanged. */
    TransportId with_kind(ControllerKind kind) const;

    /** @brief Copy with host-iface cleared (used when the "ignore-iface" option is set). */
    TransportId without_host_iface() const;

    /** @brief Copy whose host-nqn/host-id are filled in when they are empty. */
    TransportId with_host_defaults(const std::string& host_nqn, const std::string& host_id) const;

    /** @brief Relaxed equality, see the file description. */
    static bool matches(const TransportId& a, const TransportId& b);

    /** @brief "(tcp, 10.0.0.1, 8009, nqn..., eth0, 10.0.0.100)". Empty optional fields are skipped. */
    std::string to_string() const;

    /** @brief Inverse of parse_transport_id(). Empty fields are omitted. */
    TidFields as_fields() const;

    bool operator==(const TransportId& other) const;
    bool operator!=(const TransportId& other) const { return !(*this == other); }
    bool operator<(const TransportId& other) const;

private:
    friend std::optional<TransportId> parse_transport_id(const TidFields& fields, std::string* error);

    std::string transport_;
    std::string traddr_;
    std::string trsvcid_;
    std::string subsysnqn_;
    std::string host_traddr_;
    std::string host_iface_;
    std::string host_nqn_;
    std::string host_id_;
    ControllerKind kind_ = ControllerKind::Unknown;
};

/** @brief True for tcp, rdma, fc and loop. */
bool is_supported_transport(const std::string& transport);

} // namespace engine
} // namespace nvmestas

#endif // STAS_TRANSPORT_ID_H
