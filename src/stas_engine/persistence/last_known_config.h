/**
 * @file last_known_config.h
 * @brief On-disk store for the Discovery Log Page cache of each discovery controller.
 * @details The store lets a restarted daemon present the previous discovered set to the
 *          connector before the first live Get Log Page completes.
 *
 *          One file per DC, named after a 64-bit FNV-1a hash of the DC's TID fields.
 *          Layout:
 *          @code
 *          "STASLKC\0"  u32 version
 *          record*      where record = u32 length, then `length` bytes
 *          @endcode
 *          The first record holds the DC's TID fields (plus its origin), every further
 *          record holds one DLPE. A record is a u32 pair count followed by u32-length
 *          prefixed key and value strings. All integers are little-endian.
 *
 *          Anything unexpected (missing file, bad magic, other version, truncated record)
 *          reads as "absent".
 */
#ifndef STAS_LAST_KNOWN_CONFIG_H
#define STAS_LAST_KNOWN_CONFIG_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../transport/discovery_log_entry.h"
#include "../transport/transport_id.h"

namespace nvmestas {
namespace engine {

struct StoredDiscoveryCache {
    TransportId dc;
    std::string origin;
    std::vector<DiscoveryLogEntry> entries;
};

class LastKnownConfig {
public:
    static constexpr uint32_t kFormatVersion = 1;

    /** @param directory Created on the first save() if it does not exist. */
    explicit LastKnownConfig(std::string directory);

    LastKnownConfig(const LastKnownConfig&) = delete;
    LastKnownConfig& operator=(const LastKnownConfig&) = delete;

    /** @brief Replaces the stored cache of `dc`. Returns false on I/O failure (logged). */
    bool save(const TransportId& dc, const std::vector<DiscoveryLogEntry>& cache, const std::string& origin = "");

    std::optional<std::vector<DiscoveryLogEntry>> load(const TransportId& dc) const;

    /** @brief Forgets `dc`. Removing an absent entry is not an error. */
    bool remove(const TransportId& dc);

    /** @brief Every readable cache in the directory. Unreadable files are skipped. */
    std::vector<StoredDiscoveryCache> list() const;

    std::string path_for(const TransportId& dc) const;
    const std::string& directory() const { return directory_; }

private:
    std::optional<StoredDiscoveryCache> read_file(const std::string& path) const;
    bool ensure_directory() const;

    std::string directory_;
};

/** @brief Stable 64-bit FNV-1a hash of a TID's identity fields. */
uint64_t stable_tid_hash(const TransportId& tid);

} // namespace engine
} // namespace nvmestas

#endif // STAS_LAST_KNOWN_CONFIG_H
