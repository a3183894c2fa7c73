#include <relay/retry_controller.hpp>
#include <relay/util/logger.hpp>

#include <algorithm>
#include <cmath>
#include <future>
#include <memory>
#include <random>
#include <sstream>
#include <system_error>
#include <thread>
#include <unordered_set>

namespace relay {

namespace {

double jitter_fraction() {
    thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_real_distribution<double> dist(0.0, 0.3);
    return dist(rng);
}

// Another eligible provider besides `provider` exists in the snapshot
bool has_alternative(const RoutingSnapshot& snapshot, const ProviderId& provider) {
    for (const auto& p : snapshot.providers) {
        if (p.eligible && p.metrics.provider != provider) {
            return true;
        }
    }
    return false;
}

}  // namespace

RetryController::RetryController(ProviderRegistry& registry,
                                 const RoutingEngine& router,
                                 RetryPolicyConfig policy,
                                 size_t max_live_calls)
    : registry_(registry)
    , router_(router)
    , policy_(policy)
    , max_live_calls_(max_live_calls)
    , live_calls_(std::make_shared<std::atomic<size_t>>(0))
    , launcher_([](std::function<void()> work) { std::thread(std::move(work)).detach(); }) {}

bool RetryController::claim_live_slot() {
    size_t live = live_calls_->fetch_add(1, std::memory_order_acq_rel);
    if (max_live_calls_ > 0 && live >= max_live_calls_) {
        live_calls_->fetch_sub(1, std::memory_order_acq_rel);
        return false;
    }
    return true;
}

void RetryController::release_live_slot() {
    live_calls_->fetch_sub(1, std::memory_order_acq_rel);
}

uint64_t RetryController::backoff_delay_ms(uint32_t attempt) const {
    double delay = static_cast<double>(policy_.base_delay_ms) *
                   std::pow(policy_.backoff_multiplier, static_cast<double>(attempt));
    delay = std::min(delay, static_cast<double>(policy_.max_delay_ms));

    if (policy_.jitter) {
        delay += delay * jitter_fraction();
    }
    return static_cast<uint64_t>(delay);
}

bool RetryController::should_retry(ErrorCode code) const {
    if (!is_transient(code)) return false;
    if (code == ErrorCode::TIMEOUT && !policy_.retry_on_timeout) return false;
    if (code == ErrorCode::RATE_LIMITED && !policy_.retry_on_rate_limit) return false;
    return true;
}

Result<Response> RetryController::call_with_deadline(const ProviderPtr& provider,
                                                     const Request& request,
                                                     std::chrono::milliseconds timeout) {
    auto promise = std::make_shared<std::promise<Result<Response>>>();
    auto future = promise->get_future();
    auto live = live_calls_;

    // The worker owns copies of everything it touches, so an abandoned call
    // can outlive this frame and the controller
    auto work = [provider, request, promise, live]() {
        try {
            promise->set_value(provider->complete(request));
        } catch (const std::exception& e) {
            promise->set_value(Error(ErrorCode::PROVIDER_ERROR,
                std::string("Provider threw: ") + e.what()));
        } catch (...) {
            promise->set_value(Error(ErrorCode::PROVIDER_ERROR, "Provider threw a non-standard exception"));
        }
        live->fetch_sub(1, std::memory_order_acq_rel);
    };

    try {
        launcher_(std::move(work));
    } catch (const std::system_error& e) {
        release_live_slot();
        logger()->error("cannot start call worker for " + provider->provider_id() + ": " + e.what());
        return Error(ErrorCode::INTERNAL_ERROR,
            std::string("Cannot start provider call: ") + e.what());
    }

    if (future.wait_for(timeout) != std::future_status::ready) {
        return Error(ErrorCode::TIMEOUT,
            "No response within " + std::to_string(timeout.count()) + "ms");
    }
    return future.get();
}

Result<Response> RetryController::dispatch(const Request& request,
                                           std::chrono::milliseconds timeout,
                                           const RoutingSnapshot& first) {
    const uint32_t max_attempts = 1 + policy_.max_retries;

    std::unordered_set<ProviderId> tried;
    Error last_error(ErrorCode::NO_PROVIDERS_AVAILABLE, "No attempt was made");
    RoutingSnapshot snapshot = first;

    for (uint32_t attempt = 0; attempt < max_attempts; ++attempt) {
        if (attempt > 0) {
            snapshot = registry_.snapshot();
        }

        // Prefer untried providers, then fall back to any eligible one
        auto choice = router_.select(request, snapshot, tried);
        if (!choice && !tried.empty()) {
            choice = router_.select(request, snapshot);
        }
        if (!choice) {
            if (attempt == 0) {
                return choice.error();
            }
            break;
        }

        const ProviderId provider_id = *choice;
        ProviderRegistry::Entry* entry = registry_.find(provider_id);
        if (!entry) {
            return Error(ErrorCode::INTERNAL_ERROR, "Router chose unknown provider " + provider_id);
        }

        if (!claim_live_slot()) {
            logger()->warning("request " + request.id + " rejected: " +
                              std::to_string(max_live_calls_) + " provider calls still running");
            return Error(ErrorCode::OVERLOADED,
                "Provider call limit reached (" + std::to_string(max_live_calls_) + ")");
        }

        auto permit = entry->breaker->try_acquire();
        if (!permit) {
            release_live_slot();
            // Lost a race with a transition or the HalfOpen trial limit
            tried.insert(provider_id);
            last_error = permit.error();
            if (!has_alternative(snapshot, provider_id)) {
                return last_error;
            }
            continue;
        }

        auto started = std::chrono::steady_clock::now();
        auto result = call_with_deadline(entry->provider, request, timeout);
        auto latency_ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count());

        tried.insert(provider_id);

        if (result) {
            entry->breaker->on_success(*permit);
            entry->metrics->record_success(latency_ms, result->quality_score);

            Response response = std::move(result).value();
            response.id = request.id;
            response.provider = provider_id;
            response.latency_ms = latency_ms;
            response.cached = false;
            if (response.cost_usd <= 0.0 && response.tokens_used > 0) {
                response.cost_usd = static_cast<double>(response.tokens_used) *
                                    entry->metrics->snapshot().cost_per_token;
            }

            if (attempt > 0) {
                logger()->debug("request " + request.id + " succeeded on " + provider_id +
                                " after " + std::to_string(attempt + 1) + " attempts");
            }
            return response;
        }

        entry->breaker->on_failure(*permit);
        entry->metrics->record_failure();

        last_error = result.error();
        if (!should_retry(last_error.code())) {
            logger()->debug("request " + request.id + " failed permanently on " +
                            provider_id + ": " + last_error.to_string());
            return last_error;
        }

        if (attempt + 1 < max_attempts) {
            uint64_t delay = backoff_delay_ms(attempt);
            std::ostringstream ss;
            ss << "attempt " << (attempt + 1) << " on " << provider_id << " failed ("
               << last_error.to_string() << "), retrying in " << delay << "ms";
            logger()->debug(ss.str());
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }
    }

    return Error(ErrorCode::MAX_RETRIES_EXCEEDED, last_error.to_string());
}

}  // namespace relay
