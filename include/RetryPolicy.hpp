#pragma once

#include "Outcome.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace gateway_failover {

/**
 * Record of a single HTTP attempt within one logical call.
 */
struct AttemptRecord {
    std::size_t gatewayIndex = 0;                   // Position in the priority order
    uint32_t retryIndex = 0;                        // 0 = initial attempt on this gateway
    Outcome::Kind kind = Outcome::TransportError;   // Classified outcome
    uint64_t elapsedMs = 0;                         // Wall time spent on the attempt
    double complete_at = 0;                         // When this attempt completed, in seconds since epoch
};

/**
 * Context passed to retry condition functions.
 * Holds the attempt history of the current logical call across all gateways.
 */
struct RetryContext {
    std::vector<AttemptRecord> attempts;            // History of all attempts, last element is most recent
    double first_attempt_at = 0;                    // When first attempt started, in seconds since epoch

    uint32_t attemptCount() const { return static_cast<uint32_t>(attempts.size()); }
    const AttemptRecord* lastAttempt() const { return attempts.empty() ? nullptr : &attempts.back(); }

    uint32_t attemptsOn(std::size_t gatewayIndex) const {
        uint32_t n = 0;
        for (const auto& a : attempts)
            if (a.gatewayIndex == gatewayIndex) ++n;
        return n;
    }
};

/**
 * Returns true if the gateway of the last attempt should be tried again.
 */
using RetryConditionFn = std::function<bool(const RetryContext&)>;

/**
 * Returns the delay to wait for a zero-based step index.
 * For retries the index is the retry number on the gateway, for failover the index of the abandoned gateway.
 */
using BackoffScheduleFn = std::function<std::chrono::milliseconds(uint32_t)>;

/**
 * Pluggable retry and failover behavior.
 * The number of retries per gateway comes from GatewayConfig.
 */
struct RetryPolicy {
    RetryConditionFn shouldRetry;                   // Same-gateway retry condition
    BackoffScheduleFn retryDelay;                   // Delay before retrying the same gateway
    BackoffScheduleFn failoverDelay;                // Delay before advancing to the next gateway

    // Default constructor - uses the fixed retry and failover schedules
    // Defined in RetryStrategies.hpp after factory functions are available
    RetryPolicy();
};

} // namespace gateway_failover
