#pragma once

#include <cstddef>
#include <cstdint>

namespace ragcore::cache {

/**
 * @brief Counters of an in-process cache, copied out as a snapshot.
 */
struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;      ///< Entries dropped to honour capacity
    uint64_t invalidations = 0;  ///< Entries removed explicitly
    uint64_t insertions = 0;
    uint64_t ttlExpirations = 0; ///< Entries found or purged after expiry
    size_t currentSize = 0;
    size_t maxSize = 0;

    double hitRate() const {
        const uint64_t lookups = hits + misses;
        return lookups == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(lookups);
    }
};

} // namespace ragcore::cache
