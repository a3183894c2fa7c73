#pragma once

#include <relay/config.hpp>
#include <relay/types.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace relay {

/**
 * Deterministic cache key over the request fields that affect the output:
 * trimmed prompt, max_tokens (defaulted), temperature at four decimals and
 * model size preference. The request id and priority do not contribute.
 */
uint64_t request_fingerprint(const Request& request);

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t insertions = 0;
    uint64_t evictions = 0;  // Expired or capacity-dropped entries
    size_t entries = 0;
};

/**
 * RequestCache - Sharded TTL cache of completed responses.
 *
 * Each shard has its own mutex, so lookups for different fingerprints
 * rarely contend. Shard capacities sum to max_entries; there are never more
 * shards than entries. Expiry is lazy on lookup; a full shard sweeps expired
 * entries and then drops its oldest ones before inserting.
 */
class RequestCache {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    /**
     * @param clock Time source, steady_clock::now when empty
     */
    explicit RequestCache(CacheConfig config, ClockFn clock = {});

    RequestCache(const RequestCache&) = delete;
    RequestCache& operator=(const RequestCache&) = delete;

    /**
     * Look up a live entry.
     *
     * @return Copy of the cached response with cost_usd scaled by
     *         hit_cost_reduction and cached set, or nullopt on a miss
     */
    std::optional<Response> get(uint64_t fingerprint);

    /**
     * Store a response under a fingerprint, replacing any existing entry.
     */
    void put(uint64_t fingerprint, const Response& response);

    /**
     * Remove every expired entry.
     * @return Number of entries removed
     */
    size_t purge_expired();

    void clear();
    size_t size() const;
    CacheStats stats() const;

    bool enabled() const { return config_.enabled; }
    const CacheConfig& config() const { return config_; }

private:
    struct Entry {
        Response response;
        Clock::time_point inserted_at;
    };

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<uint64_t, Entry> entries;
        size_t capacity = 1;
    };

    CacheConfig config_;
    ClockFn clock_;
    std::vector<std::unique_ptr<Shard>> shards_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> insertions_{0};
    std::atomic<uint64_t> evictions_{0};

    Shard& shard_for(uint64_t fingerprint);
    bool expired(const Entry& entry, Clock::time_point now) const;

    // Caller must hold shard.mutex
    void make_room_unlocked(Shard& shard, Clock::time_point now);
};

}  // namespace relay
