#include "transport_id.h"

#include <tuple>

#include "../utils/string_utils.h"

namespace nvmestas {
namespace engine {

namespace {

std::string field_or_empty(const TidFields& fields, const char* key) {
    auto it = fields.find(key);
    return it == fields.end() ? std::string() : utils::trim_copy(it->second);
}

bool optional_field_matches(const std::string& a, const std::string& b) {
    return a.empty() || b.empty() || a == b;
}

bool subsysnqn_matches(const TransportId& a, const TransportId& b) {
    if (a.subsysnqn() == b.subsysnqn()) {
        return true;
    }
    if (a.subsysnqn() == kWellKnownDiscoveryNqn) {
        return b.is_discovery();
    }
    if (b.subsysnqn() == kWellKnownDiscoveryNqn) {
        return a.is_discovery();
    }
    return false;
}

} // namespace

bool is_supported_transport(const std::string& transport) {
    return transport == "tcp" || transport == "rdma" || transport == "fc" || transport == "loop";
}

std::optional<TransportId> parse_transport_id(const TidFields& fields, std::string* error) {
    TransportId tid;
    tid.transport_ = utils::lowercase_copy(field_or_empty(fields, "transport"));
    tid.traddr_ = field_or_empty(fields, "traddr");

    if (tid.transport_.empty()) {
        if (error) *error = "missing mandatory field: transport";
        return std::nullopt;
    }
    if (!is_supported_transport(tid.transport_)) {
        if (error) *error = "invalid transport: " + tid.transport_;
        return std::nullopt;
    }
    if (tid.traddr_.empty()) {
        if (error) *error = "missing mandatory field: traddr";
        return std::nullopt;
    }

    if (tid.transport_ == "tcp" || tid.transport_ == "rdma") {
        tid.trsvcid_ = field_or_empty(fields, "trsvcid");
        if (tid.trsvcid_.empty()) {
            tid.trsvcid_ = tid.transport_ == "rdma" ? kRdmaDefaultPort : kDiscoveryDefaultPort;
        }
    }

    tid.subsysnqn_ = field_or_empty(fields, "subsysnqn");
    if (tid.subsysnqn_.empty()) {
        tid.subsysnqn_ = field_or_empty(fields, "nqn");
    }
    tid.host_traddr_ = field_or_empty(fields, "host-traddr");
    tid.host_iface_ = field_or_empty(fields, "host-iface");
    tid.host_nqn_ = field_or_empty(fields, "host-nqn");
    tid.host_id_ = field_or_empty(fields, "host-id");

    if (tid.subsysnqn_ == kWellKnownDiscoveryNqn) {
        tid.kind_ = ControllerKind::Discovery;
    }
    return tid;
}

bool TransportId::is_discovery() const {
    return kind_ == ControllerKind::Discovery || subsysnqn_ == kWellKnownDiscoveryNqn;
}

TransportId TransportId::with_kind(ControllerKind kind) const {
    TransportId copy(*this);
    copy.kind_ = kind;
    return copy;
}

TransportId TransportId::without_host_iface() const {
    TransportId copy(*this);
    copy.host_iface_.clear();
    return copy;
}

TransportId TransportId::with_host_defaults(const std::string& host_nqn, const std::string& host_id) const {
    TransportId copy(*this);
    if (copy.host_nqn_.empty()) {
        copy.host_nqn_ = host_nqn;
    }
    if (copy.host_id_.empty()) {
        copy.host_id_ = host_id;
    }
    return copy;
}

bool TransportId::matches(const TransportId& a, const TransportId& b) {
    return a.transport_ == b.transport_ &&
           a.traddr_ == b.traddr_ &&
           a.trsvcid_ == b.trsvcid_ &&
           a.host_traddr_ == b.host_traddr_ &&
           optional_field_matches(a.host_iface_, b.host_iface_) &&
           optional_field_matches(a.host_nqn_, b.host_nqn_) &&
           optional_field_matches(a.host_id_, b.host_id_) &&
           subsysnqn_matches(a, b);
}

std::string TransportId::to_string() const {
    std::string text = "(" + transport_ + ", " + traddr_;
    if (!trsvcid_.empty()) {
        text += ", " + trsvcid_;
    }
    if (!subsysnqn_.empty()) {
        text += ", " + subsysnqn_;
    }
    if (!host_iface_.empty()) {
        text += ", " + host_iface_;
    }
    if (!host_traddr_.empty()) {
        text += ", " + host_traddr_;
    }
    text += ")";
    return text;
}

TidFields TransportId::as_fields() const {
    TidFields fields;
    auto put = [&fields](const char* key, const std::string& value) {
        if (!value.empty()) {
            fields[key] = value;
        }
    };
    put("transport", transport_);
    put("traddr", traddr_);
    put("trsvcid", trsvcid_);
    put("subsysnqn", subsysnqn_);
    put("host-traddr", host_traddr_);
    put("host-iface", host_iface_);
    put("host-nqn", host_nqn_);
    put("host-id", host_id_);
    return fields;
}

bool TransportId::operator==(const TransportId& other) const {
    return std::tie(transport_, traddr_, trsvcid_, subsysnqn_, host_traddr_, host_iface_, host_nqn_, host_id_) ==
           std::tie(other.transport_, other.traddr_, other.trsvcid_, other.subsysnqn_,
                    other.host_traddr_, other.host_iface_, other.host_nqn_, other.host_id_);
}

bool TransportId::operator<(const TransportId& other) const {
    return std::tie(transport_, traddr_, trsvcid_, subsysnqn_, host_traddr_, host_iface_, host_nqn_, host_id_) <
           std::tie(other.transport_, other.traddr_, other.trsvcid_, other.subsysnqn_,
                    other.host_traddr_, other.host_iface_, other.host_nqn_, other.host_id_);
}

} // namespace engine
} // namespace nvmestas
