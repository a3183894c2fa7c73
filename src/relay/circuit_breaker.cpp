#include <relay/circuit_breaker.hpp>
#include <relay/util/logger.hpp>

namespace relay {

const char* circuit_state_name(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED: return "closed";
        case CircuitState::OPEN: return "open";
        case CircuitState::HALF_OPEN: return "half_open";
    }
    return "closed";
}

CircuitBreaker::CircuitBreaker(ProviderId provider, CircuitBreakerConfig config)
    : provider_(std::move(provider))
    , config_(config)
{}

int64_t CircuitBreaker::now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now().time_since_epoch()).count();
}

bool CircuitBreaker::cooldown_elapsed() const {
    int64_t elapsed = now_ms() - opened_at_ms_.load(std::memory_order_acquire);
    return elapsed >= static_cast<int64_t>(config_.timeout_ms);
}

void CircuitBreaker::maybe_half_open() {
    if (state_.load(std::memory_order_acquire) != CircuitState::OPEN || !cooldown_elapsed()) {
        return;
    }

    std::lock_guard<std::mutex> lock(transition_mutex_);
    // Re-check: another caller may have moved it already
    if (state_.load(std::memory_order_acquire) == CircuitState::OPEN && cooldown_elapsed()) {
        transition_unlocked(CircuitState::HALF_OPEN);
    }
}

bool CircuitBreaker::is_eligible() {
    maybe_half_open();

    switch (state_.load(std::memory_order_acquire)) {
        case CircuitState::CLOSED:
            return true;
        case CircuitState::OPEN:
            return false;
        case CircuitState::HALF_OPEN:
            return half_open_in_flight_.load(std::memory_order_acquire) < config_.half_open_max_calls;
    }
    return false;
}

Result<CircuitBreaker::Permit> CircuitBreaker::try_acquire() {
    maybe_half_open();

    // Closed fast path. Transitions bump the generation before publishing the
    // state, so an unchanged generation around the state read means the
    // permit belongs to the Closed period it observed.
    uint64_t generation = generation_.load(std::memory_order_acquire);
    if (state_.load(std::memory_order_acquire) == CircuitState::CLOSED &&
        generation_.load(std::memory_order_acquire) == generation) {
        return Permit{false, generation};
    }

    std::lock_guard<std::mutex> lock(transition_mutex_);
    generation = generation_.load(std::memory_order_acquire);

    switch (state_.load(std::memory_order_acquire)) {
        case CircuitState::CLOSED:
            return Permit{false, generation};
        case CircuitState::OPEN:
            break;
        case CircuitState::HALF_OPEN:
            if (half_open_in_flight_.load(std::memory_order_acquire) >= config_.half_open_max_calls) {
                return Error(ErrorCode::CIRCUIT_BREAKER_OPEN,
                    "Circuit breaker half-open trial limit reached for provider: " + provider_);
            }
            half_open_in_flight_.fetch_add(1, std::memory_order_acq_rel);
            return Permit{true, generation};
    }

    return Error(ErrorCode::CIRCUIT_BREAKER_OPEN,
        "Circuit breaker open for provider: " + provider_);
}

void CircuitBreaker::release_trial(const Permit& permit) {
    if (permit.trial) {
        half_open_in_flight_.fetch_sub(1, std::memory_order_acq_rel);
    }
}

void CircuitBreaker::on_success(const Permit& permit) {
    // Fast path: nothing to reset while healthy
    if (!permit.trial &&
        state_.load(std::memory_order_acquire) == CircuitState::CLOSED &&
        failure_count_.load(std::memory_order_relaxed) == 0) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(transition_mutex_);

        // Outcomes admitted under an earlier state do not drive this one
        if (permit.generation == generation_.load(std::memory_order_acquire)) {
            switch (state_.load(std::memory_order_acquire)) {
                case CircuitState::CLOSED:
                    failure_count_.store(0, std::memory_order_relaxed);
                    break;
                case CircuitState::HALF_OPEN: {
                    uint32_t successes = success_count_.fetch_add(1, std::memory_order_relaxed) + 1;
                    if (successes >= config_.success_threshold) {
                        transition_unlocked(CircuitState::CLOSED);
                    }
                    break;
                }
                case CircuitState::OPEN:
                    break;
            }
        }
    }

    release_trial(permit);
}

void CircuitBreaker::on_failure(const Permit& permit) {
    {
        std::lock_guard<std::mutex> lock(transition_mutex_);

        if (permit.generation == generation_.load(std::memory_order_acquire)) {
            switch (state_.load(std::memory_order_acquire)) {
                case CircuitState::CLOSED: {
                    uint32_t failures = failure_count_.fetch_add(1, std::memory_order_relaxed) + 1;
                    if (failures >= config_.failure_threshold) {
                        transition_unlocked(CircuitState::OPEN);
                    }
                    break;
                }
                case CircuitState::HALF_OPEN:
                    transition_unlocked(CircuitState::OPEN);
                    break;
                case CircuitState::OPEN:
                    break;
            }
        }
    }

    release_trial(permit);
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(transition_mutex_);
    transition_unlocked(CircuitState::CLOSED);
}

void CircuitBreaker::transition_unlocked(CircuitState to) {
    CircuitState from = state_.load(std::memory_order_acquire);

    failure_count_.store(0, std::memory_order_relaxed);
    success_count_.store(0, std::memory_order_relaxed);
    if (to == CircuitState::OPEN) {
        opened_at_ms_.store(now_ms(), std::memory_order_release);
    }

    // Generation before state: a reader that sees the new state also sees
    // the new generation.
    generation_.fetch_add(1, std::memory_order_acq_rel);
    state_.store(to, std::memory_order_release);
    transitions_.fetch_add(1, std::memory_order_relaxed);

    auto log = logger();
    std::string message = "circuit breaker [" + provider_ + "] " +
        circuit_state_name(from) + " -> " + circuit_state_name(to);
    if (to == CircuitState::OPEN) {
        log->warning(message);
    } else {
        log->info(message);
    }
}

}  // namespace relay
