#include "codec/codec_cache.hpp"

namespace msgcodec::codec {

MessageCodecPtr CodecCache::lookup(const TypeDescriptorPtr& type) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(type);
    if (it == entries_.end()) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }
    hits_.fetch_add(1, std::memory_order_relaxed);
    return it->second;
}

MessageCodecPtr CodecCache::insert(const TypeDescriptorPtr& type, MessageCodecPtr codec) {
    std::unique_lock lock(mutex_);
    auto [it, inserted] = entries_.try_emplace(type, std::move(codec));
    if (!inserted) {
        lost_races_.fetch_add(1, std::memory_order_relaxed);
    }
    return it->second;
}

CodecCache::Stats CodecCache::get_stats() const {
    std::shared_lock lock(mutex_);
    return {entries_.size(), hits_.load(std::memory_order_relaxed),
            misses_.load(std::memory_order_relaxed), lost_races_.load(std::memory_order_relaxed)};
}

} // namespace msgcodec::codec
