#pragma once

#include <relay/config.hpp>
#include <relay/result.hpp>
#include <relay/types.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>

namespace relay {

enum class CircuitState {
    CLOSED,
    OPEN,
    HALF_OPEN
};

const char* circuit_state_name(CircuitState state);

/**
 * CircuitBreaker - Per-provider failure state machine.
 *
 * Closed: calls permitted; failure_threshold consecutive failures open it.
 * Open: calls rejected; after timeout_ms the next eligibility check moves it
 *       to HalfOpen (no background timer).
 * HalfOpen: at most half_open_max_calls trials in flight; any failure
 *       reopens it, success_threshold consecutive successes close it.
 *
 * The state is readable without locking. Transitions and HalfOpen trial
 * admission happen under a short mutex because they combine a state check
 * with several counter updates.
 */
class CircuitBreaker {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * Admission ticket for one call. Report its outcome with on_success()
     * or on_failure() exactly once.
     */
    struct Permit {
        bool trial = false;        // Counted against the HalfOpen trial limit
        uint64_t generation = 0;   // Breaker generation when admitted
    };

    CircuitBreaker(ProviderId provider, CircuitBreakerConfig config);

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /**
     * Whether a call could be admitted right now. Performs the lazy
     * Open -> HalfOpen transition when the cooldown has elapsed.
     */
    bool is_eligible();

    /**
     * Admit a call, or fail with CIRCUIT_BREAKER_OPEN. Closed admission is
     * lock-free; HalfOpen trial slots are claimed under the transition mutex
     * so a trial always carries the generation of the HalfOpen it joins.
     */
    Result<Permit> try_acquire();

    void on_success(const Permit& permit);
    void on_failure(const Permit& permit);

    /**
     * Force the breaker back to Closed and clear all counters.
     */
    void reset();

    CircuitState state() const { return state_.load(std::memory_order_acquire); }
    uint32_t failure_count() const { return failure_count_.load(std::memory_order_relaxed); }
    uint32_t success_count() const { return success_count_.load(std::memory_order_relaxed); }
    uint32_t half_open_in_flight() const { return half_open_in_flight_.load(std::memory_order_relaxed); }
    uint64_t transition_count() const { return transitions_.load(std::memory_order_relaxed); }

    const ProviderId& provider() const { return provider_; }
    const CircuitBreakerConfig& config() const { return config_; }

private:
    ProviderId provider_;
    CircuitBreakerConfig config_;

    std::atomic<CircuitState> state_{CircuitState::CLOSED};
    std::atomic<uint32_t> failure_count_{0};
    std::atomic<uint32_t> success_count_{0};
    std::atomic<uint32_t> half_open_in_flight_{0};
    std::atomic<int64_t> opened_at_ms_{0};      // steady_clock ms of last Open
    std::atomic<uint64_t> generation_{0};       // Bumped on every transition
    std::atomic<uint64_t> transitions_{0};

    std::mutex transition_mutex_;

    static int64_t now_ms();

    bool cooldown_elapsed() const;
    void maybe_half_open();
    void release_trial(const Permit& permit);

    // Must hold transition_mutex_
    void transition_unlocked(CircuitState to);
};

}  // namespace relay
