#include "last_known_config.h"

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>

#include "../utils/stas_logger.h"
#include "../utils/string_utils.h"

namespace nvmestas {
namespace engine {

namespace {

constexpr char kMagic[8] = {'S', 'T', 'A', 'S', 'L', 'K', 'C', '\0'};
constexpr const char* kFileSuffix = ".lkc";
constexpr const char* kOriginKey = "origin";
constexpr uint32_t kMaxRecordSize = 64 * 1024;

using Bytes = std::vector<uint8_t>;

void append_u32(Bytes& out, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xff));
    }
}

void append_string(Bytes& out, const std::string& value) {
    append_u32(out, static_cast<uint32_t>(value.size()));
    out.insert(out.end(), value.begin(), value.end());
}

Bytes encode_fields(const TidFields& fields) {
    Bytes out;
    append_u32(out, static_cast<uint32_t>(fields.size()));
    for (const auto& kv : fields) {
        append_string(out, kv.first);
        append_string(out, kv.second);
    }
    return out;
}

void append_record(Bytes& out, const Bytes& record) {
    append_u32(out, static_cast<uint32_t>(record.size()));
    out.insert(out.end(), record.begin(), record.end());
}

// Bounds-checked reader over a byte buffer.
class Reader {
public:
    Reader(const uint8_t* data, size_t size) : data_(data), size_(size) {}

    bool read_u32(uint32_t& value) {
        if (size_ - pos_ < 4) {
            return false;
        }
        value = 0;
        for (int i = 3; i >= 0; --i) {
            value = (value << 8) | data_[pos_ + static_cast<size_t>(i)];
        }
        pos_ += 4;
        return true;
    }

    bool read_bytes(size_t len, const uint8_t*& out) {
        if (size_ - pos_ < len) {
            return false;
        }
        out = data_ + pos_;
        pos_ += len;
        return true;
    }

    bool read_string(std::string& out) {
        uint32_t len = 0;
        const uint8_t* bytes = nullptr;
        if (!read_u32(len) || !read_bytes(len, bytes)) {
            return false;
        }
        out.assign(reinterpret_cast<const char*>(bytes), len);
        return true;
    }

    bool at_end() const { return pos_ == size_; }

private:
    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
};

bool decode_fields(const uint8_t* data, size_t size, TidFields& out) {
    Reader reader(data, size);
    uint32_t count = 0;
    if (!reader.read_u32(count)) {
        return false;
    }
    for (uint32_t i = 0; i < count; ++i) {
        std::string key;
        std::string value;
        if (!reader.read_string(key) || !reader.read_string(value)) {
            return false;
        }
        out[key] = value;
    }
    return reader.at_end();
}

uint16_t field_u16(const TidFields& fields, const char* key) {
    auto it = fields.find(key);
    if (it == fields.end()) {
        return 0;
    }
    auto value = utils::parse_long(it->second);
    if (!value || *value < 0 || *value > 0xffff) {
        return 0;
    }
    return static_cast<uint16_t>(*value);
}

std::string field_str(const TidFields& fields, const char* key) {
    auto it = fields.find(key);
    return it == fields.end() ? std::string() : it->second;
}

DiscoveryLogEntry entry_from_fields(const TidFields& fields) {
    DiscoveryLogEntry entry;
    entry.trtype = field_str(fields, "trtype");
    entry.adrfam = field_str(fields, "adrfam");
    entry.subtype = field_str(fields, "subtype");
    entry.treq = field_str(fields, "treq");
    entry.portid = field_u16(fields, "portid");
    entry.cntlid = field_u16(fields, "cntlid");
    entry.asqsz = field_u16(fields, "asqsz");
    entry.eflags = field_u16(fields, "eflags");
    entry.trsvcid = field_str(fields, "trsvcid");
    entry.subnqn = field_str(fields, "subnqn");
    entry.traddr = field_str(fields, "traddr");
    return entry;
}

} // namespace

uint64_t stable_tid_hash(const TransportId& tid) {
    uint64_t hash = 14695981039346656037ULL;
    for (const auto& kv : tid.as_fields()) {
        for (const std::string* part : {&kv.first, &kv.second}) {
            for (unsigned char c : *part) {
                hash ^= c;
                hash *= 1099511628211ULL;
            }
            hash ^= 0xff;
            hash *= 1099511628211ULL;
        }
    }
    return hash;
}

LastKnownConfig::LastKnownConfig(std::string directory) : directory_(std::move(directory)) {}

std::string LastKnownConfig::path_for(const TransportId& dc) const {
    char name[32];
    std::snprintf(name, sizeof(name), "%016llx", static_cast<unsigned long long>(stable_tid_hash(dc)));
    return directory_ + "/" + name + kFileSuffix;
}

bool LastKnownConfig::ensure_directory() const {
    std::string partial = utils::starts_with(directory_, "/") ? "" : ".";
    for (const auto& component : utils::split_trimmed(directory_, '/')) {
        partial += "/" + component;
        if (mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
            LOG_STAS_ERROR("Cannot create %s: %s", partial.c_str(), strerror(errno));
            return false;
        }
    }
    return true;
}

bool LastKnownConfig::save(const TransportId& dc, const std::vector<DiscoveryLogEntry>& cache, const std::string& origin) {
    if (!ensure_directory()) {
        return false;
    }

    Bytes data(kMagic, kMagic + sizeof(kMagic));
    append_u32(data, kFormatVersion);

    TidFields header = dc.as_fields();
    if (!origin.empty()) {
        header[kOriginKey] = origin;
    }
    append_record(data, encode_fields(header));
    for (const auto& entry : cache) {
        append_record(data, encode_fields(entry.as_fields()));
    }

    const std::string path = path_for(dc);
    const std::string tmp_path = path + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            LOG_STAS_ERROR("Cannot write %s: %s", tmp_path.c_str(), strerror(errno));
            return false;
        }
        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        file.flush();
        if (!file) {
            LOG_STAS_ERROR("Short write to %s", tmp_path.c_str());
            file.close();
            unlink(tmp_path.c_str());
            return false;
        }
    }
    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        LOG_STAS_ERROR("Cannot rename %s: %s", tmp_path.c_str(), strerror(errno));
        unlink(tmp_path.c_str());
        return false;
    }
    LOG_STAS_DEBUG("Saved %zu log page entries for %s", cache.size(), dc.to_string().c_str());
    return true;
}

std::optional<StoredDiscoveryCache> LastKnownConfig::read_file(const std::string& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    const Bytes data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    if (data.size() < sizeof(kMagic) + 4 || std::memcmp(data.data(), kMagic, sizeof(kMagic)) != 0) {
        LOG_STAS_WARNING("Ignoring %s: not a cache file", path.c_str());
        return std::nullopt;
    }
    Reader reader(data.data() + sizeof(kMagic), data.size() - sizeof(kMagic));
    uint32_t version = 0;
    if (!reader.read_u32(version) || version != kFormatVersion) {
        LOG_STAS_WARNING("Ignoring %s: unsupported version %u", path.c_str(), version);
        return std::nullopt;
    }

    StoredDiscoveryCache stored;
    bool have_header = false;
    while (!reader.at_end()) {
        uint32_t length = 0;
        const uint8_t* bytes = nullptr;
        TidFields fields;
        if (!reader.read_u32(length) || length > kMaxRecordSize || !reader.read_bytes(length, bytes) ||
            !decode_fields(bytes, length, fields)) {
            LOG_STAS_WARNING("Ignoring %s: truncated or corrupt record", path.c_str());
            return std::nullopt;
        }
        if (!have_header) {
            auto origin = fields.find(kOriginKey);
            if (origin != fields.end()) {
                stored.origin = origin->second;
                fields.erase(origin);
            }
            auto dc = parse_transport_id(fields);
            if (!dc) {
                LOG_STAS_WARNING("Ignoring %s: unusable controller identity", path.c_str());
                return std::nullopt;
            }
            stored.dc = dc->with_kind(ControllerKind::Discovery);
            have_header = true;
        } else {
            stored.entries.push_back(entry_from_fields(fields));
        }
    }
    if (!have_header) {
        return std::nullopt;
    }
    return stored;
}

std::optional<std::vector<DiscoveryLogEntry>> LastKnownConfig::load(const TransportId& dc) const {
    auto stored = read_file(path_for(dc));
    if (!stored || stored->dc != dc) {
        return std::nullopt;
    }
    return stored->entries;
}

bool LastKnownConfig::remove(const TransportId& dc) {
    const std::string path = path_for(dc);
    if (unlink(path.c_str()) != 0 && errno != ENOENT) {
        LOG_STAS_WARNING("Cannot remove %s: %s", path.c_str(), strerror(errno));
        return false;
    }
    return true;
}

std::vector<StoredDiscoveryCache> LastKnownConfig::list() const {
    std::vector<StoredDiscoveryCache> result;
    DIR* dir = opendir(directory_.c_str());
    if (!dir) {
        return result;
    }
    std::vector<std::string> names;
    while (auto* entry = readdir(dir)) {
        const std::string name(entry->d_name);
        const std::string suffix(kFileSuffix);
        if (name.size() > suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
            names.push_back(name);
        }
    }
    closedir(dir);

    for (const auto& name : names) {
        auto stored = read_file(directory_ + "/" + name);
        if (stored) {
            result.push_back(std::move(*stored));
        }
    }
    return result;
}

} // namespace engine
} // namespace nvmestas
