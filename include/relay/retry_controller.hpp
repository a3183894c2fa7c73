#pragma once

#include <relay/config.hpp>
#include <relay/provider.hpp>
#include <relay/provider_registry.hpp>
#include <relay/result.hpp>
#include <relay/routing_engine.hpp>
#include <relay/types.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

namespace relay {

/**
 * RetryController - Dispatches a request with provider fail-over.
 *
 * Each attempt routes over a fresh snapshot, preferring providers not yet
 * tried for this request. Every attempt outcome is reported exactly once to
 * the chosen provider's breaker and metrics. Transient errors back off and
 * retry; permanent errors end the request immediately.
 *
 * Provider calls run on detached workers that may outlive an abandoned
 * attempt. With max_live_calls set, at most that many workers exist at
 * once, including abandoned ones; an attempt past the cap fails with
 * OVERLOADED before its breaker is consulted.
 */
class RetryController {
public:
    // Starts a provider call worker; throws std::system_error on failure
    using Launcher = std::function<void(std::function<void()>)>;

    RetryController(ProviderRegistry& registry,
                    const RoutingEngine& router,
                    RetryPolicyConfig policy,
                    size_t max_live_calls = 0);

    /**
     * Run up to 1 + max_retries attempts.
     *
     * @param request Validated request
     * @param timeout Per-attempt deadline
     * @param first Snapshot to route the first attempt on
     * @return Response with provider, latency and cost filled in, or
     *         NO_PROVIDERS_AVAILABLE, CIRCUIT_BREAKER_OPEN, OVERLOADED,
     *         MAX_RETRIES_EXCEEDED or a permanent provider error
     */
    Result<Response> dispatch(const Request& request,
                              std::chrono::milliseconds timeout,
                              const RoutingSnapshot& first);

    /**
     * Backoff before the attempt after `attempt` (0-based), without jitter
     * when jitter is disabled: min(max_delay, base_delay * multiplier^attempt)
     * plus up to 30% when enabled.
     */
    uint64_t backoff_delay_ms(uint32_t attempt) const;

    /**
     * Whether an error may be retried under this policy.
     */
    bool should_retry(ErrorCode code) const;

    /**
     * Replace the worker launcher (a detached std::thread by default).
     */
    void set_launcher(Launcher launcher) { launcher_ = std::move(launcher); }

    // Provider call workers currently running, abandoned ones included
    size_t live_calls() const { return live_calls_->load(std::memory_order_acquire); }
    size_t max_live_calls() const { return max_live_calls_; }

    const RetryPolicyConfig& policy() const { return policy_; }

private:
    ProviderRegistry& registry_;
    const RoutingEngine& router_;
    RetryPolicyConfig policy_;
    size_t max_live_calls_;
    std::shared_ptr<std::atomic<size_t>> live_calls_;
    Launcher launcher_;

    bool claim_live_slot();
    void release_live_slot();

    /**
     * Call a provider with a deadline, consuming a claimed live slot. The
     * call runs on a worker that releases the slot when the provider
     * returns; if the deadline passes first its result is discarded and
     * TIMEOUT is returned. Exceptions from the provider become
     * PROVIDER_ERROR, a worker that cannot be started INTERNAL_ERROR.
     */
    Result<Response> call_with_deadline(const ProviderPtr& provider,
                                        const Request& request,
                                        std::chrono::milliseconds timeout);
};

}  // namespace relay
