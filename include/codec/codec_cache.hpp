//! # Codec Cache
//!
//! Thread-safe memoization of derived codecs, keyed by structural descriptor
//! equality. Uses `std::shared_mutex` for concurrent read access.
//!
//! Entries are never evicted or replaced: `insert` keeps the first codec
//! stored for a descriptor and hands that one back to every later caller.

#pragma once

#include "codec/message_codec.hpp"

#include <atomic>
#include <mutex>
#include <shared_mutex>

namespace msgcodec::codec {

/// Insert-if-absent codec cache.
class CodecCache {
public:
    /// Look up a cached codec. Returns null if not cached.
    [[nodiscard]] MessageCodecPtr lookup(const TypeDescriptorPtr& type) const;

    /// Store `codec` unless an entry exists; returns the entry now cached.
    MessageCodecPtr insert(const TypeDescriptorPtr& type, MessageCodecPtr codec);

    /// Cache statistics.
    struct Stats {
        size_t total_entries = 0;
        size_t hits = 0;
        size_t misses = 0;
        size_t lost_races = 0; ///< Inserts that found an entry already present
    };

    /// Get cache statistics.
    [[nodiscard]] Stats get_stats() const;

private:
    mutable std::shared_mutex mutex_;
    CodecMap entries_;
    mutable std::atomic<size_t> hits_{0};
    mutable std::atomic<size_t> misses_{0};
    std::atomic<size_t> lost_races_{0};
};

} // namespace msgcodec::codec
