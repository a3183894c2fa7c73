#pragma once

#include <relay/result.hpp>
#include <relay/types.hpp>

#include <memory>
#include <string>
#include <vector>

namespace relay {

// ============================================================================
// Abstract Provider Interface
// ============================================================================

/**
 * A backend capable of serving completion requests.
 *
 * Implementations must be safe to call from many threads at once. The load
 * balancer may abandon a call whose deadline expired; the implementation
 * keeps running until it returns and its result is discarded.
 */
class Provider {
public:
    virtual ~Provider() = default;

    // Identification
    virtual ProviderId provider_id() const = 0;

    // Core completion. Errors use the provider ErrorCodes
    // (RATE_LIMITED, TIMEOUT, PROVIDER_ERROR, INVALID_REQUEST, AUTH_ERROR...)
    virtual Result<Response> complete(const Request& request) = 0;

    // Capabilities
    virtual std::vector<ModelInfo> supported_models() const = 0;
    virtual double base_cost_per_token() const = 0;

    // Liveness probe
    virtual bool health_check() = 0;
};

using ProviderPtr = std::shared_ptr<Provider>;

}  // namespace relay
