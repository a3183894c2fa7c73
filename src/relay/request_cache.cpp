#include <relay/request_cache.hpp>
#include <relay/util/fnv1a.hpp>

#include <algorithm>
#include <cstdio>

namespace relay {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

}  // namespace

uint64_t request_fingerprint(const Request& request) {
    // Fields are separated by a byte that cannot appear in the formatted numbers
    uint64_t hash = FNV1a::update(FNV1a::OFFSET_BASIS, trim(request.prompt));
    hash = FNV1a::update(hash, std::string(1, '\x1f'));

    hash = FNV1a::update(hash, std::to_string(request.max_tokens.value_or(DEFAULT_MAX_TOKENS)));
    hash = FNV1a::update(hash, std::string(1, '\x1f'));

    if (request.temperature) {
        // -0.0 and 0.0 are the same sampling setting
        double temperature = *request.temperature == 0.0 ? 0.0 : *request.temperature;
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.4f", temperature);
        hash = FNV1a::update(hash, std::string(buf));
    } else {
        hash = FNV1a::update(hash, std::string("default"));
    }
    hash = FNV1a::update(hash, std::string(1, '\x1f'));

    hash = FNV1a::update(hash, request.model_preference
        ? std::string(model_size_name(*request.model_preference))
        : std::string("any"));

    return hash;
}

RequestCache::RequestCache(CacheConfig config, ClockFn clock)
    : config_(config)
    , clock_(std::move(clock))
{
    if (!clock_) {
        clock_ = [] { return Clock::now(); };
    }

    size_t total = std::max<size_t>(1, config_.max_entries);
    size_t shard_count = std::clamp<size_t>(config_.shards, 1, total);

    // Spread the remainder over the first shards
    size_t base = total / shard_count;
    size_t extra = total % shard_count;

    shards_.reserve(shard_count);
    for (size_t i = 0; i < shard_count; ++i) {
        auto shard = std::make_unique<Shard>();
        shard->capacity = base + (i < extra ? 1 : 0);
        shards_.push_back(std::move(shard));
    }
}

RequestCache::Shard& RequestCache::shard_for(uint64_t fingerprint) {
    return *shards_[fingerprint % shards_.size()];
}

bool RequestCache::expired(const Entry& entry, Clock::time_point now) const {
    return now - entry.inserted_at >= std::chrono::seconds(config_.ttl_seconds);
}

std::optional<Response> RequestCache::get(uint64_t fingerprint) {
    if (!config_.enabled) {
        return std::nullopt;
    }

    Shard& shard = shard_for(fingerprint);
    auto now = clock_();

    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.entries.find(fingerprint);
    if (it == shard.entries.end() || expired(it->second, now)) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    hits_.fetch_add(1, std::memory_order_relaxed);
    Response response = it->second.response;
    response.cost_usd *= config_.hit_cost_reduction;
    response.cached = true;
    return response;
}

void RequestCache::put(uint64_t fingerprint, const Response& response) {
    if (!config_.enabled) {
        return;
    }

    Shard& shard = shard_for(fingerprint);
    auto now = clock_();

    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.entries.find(fingerprint);
    if (it == shard.entries.end() && shard.entries.size() >= shard.capacity) {
        make_room_unlocked(shard, now);
    }

    Entry entry{response, now};
    entry.response.cached = false;
    shard.entries[fingerprint] = std::move(entry);
    insertions_.fetch_add(1, std::memory_order_relaxed);
}

void RequestCache::make_room_unlocked(Shard& shard, Clock::time_point now) {
    // Remove expired entries
    for (auto it = shard.entries.begin(); it != shard.entries.end(); ) {
        if (expired(it->second, now)) {
            it = shard.entries.erase(it);
            evictions_.fetch_add(1, std::memory_order_relaxed);
        } else {
            ++it;
        }
    }

    // If still too full, remove oldest entries
    while (shard.entries.size() >= shard.capacity && !shard.entries.empty()) {
        auto oldest = shard.entries.begin();
        for (auto it = shard.entries.begin(); it != shard.entries.end(); ++it) {
            if (it->second.inserted_at < oldest->second.inserted_at) {
                oldest = it;
            }
        }
        shard.entries.erase(oldest);
        evictions_.fetch_add(1, std::memory_order_relaxed);
    }
}

size_t RequestCache::purge_expired() {
    auto now = clock_();
    size_t removed = 0;

    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        for (auto it = shard->entries.begin(); it != shard->entries.end(); ) {
            if (expired(it->second, now)) {
                it = shard->entries.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }

    evictions_.fetch_add(removed, std::memory_order_relaxed);
    return removed;
}

void RequestCache::clear() {
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        shard->entries.clear();
    }
}

size_t RequestCache::size() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        total += shard->entries.size();
    }
    return total;
}

CacheStats RequestCache::stats() const {
    CacheStats s;
    s.hits = hits_.load(std::memory_order_relaxed);
    s.misses = misses_.load(std::memory_order_relaxed);
    s.insertions = insertions_.load(std::memory_order_relaxed);
    s.evictions = evictions_.load(std::memory_order_relaxed);
    s.entries = size();
    return s;
}

}  // namespace relay
