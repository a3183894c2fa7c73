#pragma once

/**
 * Relay
 *
 * Multi-provider LLM load balancer: weighted routing, circuit breakers,
 * retries with fail-over, response caching and hourly budget enforcement.
 */

#include <relay/result.hpp>
#include <relay/types.hpp>
#include <relay/config.hpp>
#include <relay/provider.hpp>
#include <relay/load_balancer.hpp>
#include <relay/util/logger.hpp>
