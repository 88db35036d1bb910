#pragma once

#include "RetryPolicy.hpp"
#include "utils.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <set>
#include <utility>
#include <vector>

namespace gateway_failover {

// ============ Delay Schedules ============
// Single definition of every backoff step and jitter bound, shared by the client and its tests.
namespace schedule {

// Before retrying the same gateway, indexed by retry number
constexpr std::array<uint64_t, 3> RETRY_DELAYS_MS = {200, 500, 1000};
constexpr uint64_t RETRY_JITTER_MS = 50;

// Before advancing to the next gateway, indexed by the abandoned gateway
constexpr std::array<uint64_t, 3> FAILOVER_DELAYS_MS = {300, 1000, 2000};
constexpr uint64_t FAILOVER_JITTER_MS = 100;

// Steps past the end of the table repeat the last one
template <std::size_t N>
constexpr uint64_t step(const std::array<uint64_t, N>& steps, uint32_t index) {
    return steps[std::min<std::size_t>(index, N - 1)];
}

constexpr uint64_t retryBaseDelay(uint32_t retryIndex) { return step(RETRY_DELAYS_MS, retryIndex); }
constexpr uint64_t failoverBaseDelay(uint32_t gatewayIndex) { return step(FAILOVER_DELAYS_MS, gatewayIndex); }

} // namespace schedule

namespace retry {

// ============ Retry Conditions ============

/**
 * Retry when the last outcome is one of the given kinds.
 */
inline RetryConditionFn outcomeCondition(std::set<Outcome::Kind> kinds) {
    return [kinds = std::move(kinds)](const RetryContext& ctx) -> bool {
        auto* last = ctx.lastAttempt();
        if (!last) return false;
        return kinds.count(last->kind) > 0;
    };
}

/**
 * Default retry condition: timeouts, transport failures and server errors.
 * Rate limiting is never retried on the same gateway.
 */
inline RetryConditionFn defaultCondition() {
    return outcomeCondition({Outcome::Timeout, Outcome::TransportError, Outcome::ServerError});
}

// ============ Backoff Strategies ============

/**
 * Stepped backoff: steps[index] (last step repeated) plus uniform jitter in [0, jitterMs).
 */
inline BackoffScheduleFn steppedBackoff(std::vector<uint64_t> stepsMs, uint64_t jitterMs) {
    return [stepsMs = std::move(stepsMs), jitterMs](uint32_t index) -> std::chrono::milliseconds {
        uint64_t delay = stepsMs.empty() ? 0 : stepsMs[std::min<std::size_t>(index, stepsMs.size() - 1)];
        return std::chrono::milliseconds(delay + util::jitter_generator(jitterMs));
    };
}

/**
 * Same-gateway retry schedule: 200ms, 500ms, then 1s, each plus [0, 50)ms jitter.
 */
inline BackoffScheduleFn retryBackoff() {
    return steppedBackoff(
        std::vector<uint64_t>(schedule::RETRY_DELAYS_MS.begin(), schedule::RETRY_DELAYS_MS.end()),
        schedule::RETRY_JITTER_MS);
}

/**
 * Gateway failover schedule: 300ms, 1s, then 2s, each plus [0, 100)ms jitter.
 */
inline BackoffScheduleFn failoverBackoff() {
    return steppedBackoff(
        std::vector<uint64_t>(schedule::FAILOVER_DELAYS_MS.begin(), schedule::FAILOVER_DELAYS_MS.end()),
        schedule::FAILOVER_JITTER_MS);
}

} // namespace retry

// Default constructor implementation for RetryPolicy
inline RetryPolicy::RetryPolicy()
    : shouldRetry(retry::defaultCondition())
    , retryDelay(retry::retryBackoff())
    , failoverDelay(retry::failoverBackoff())
{}

} // namespace gateway_failover
