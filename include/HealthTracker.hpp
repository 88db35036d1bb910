#pragma once

#include "GatewayConfig.hpp"
#include "Outcome.hpp"
#include "models.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace gateway_failover {

/**
 * Per-gateway health records, index-aligned with the priority order.
 * Thread-safe; the lock covers only the records.
 */
class HealthTracker {
public:
	explicit HealthTracker(const GatewayList& gateways);

	// non-copyable
	HealthTracker(const HealthTracker&) = delete;
	HealthTracker& operator=(const HealthTracker&) = delete;

	// Throws std::out_of_range for an unknown gateway index
	void record_attempt(size_t gatewayIndex, const Outcome& outcome, uint64_t elapsedMs);

	std::vector<GatewayHealth> snapshot() const;
	GatewayHealth at(size_t gatewayIndex) const;
	size_t size() const;

private:
	mutable std::mutex mutex_;
	std::vector<GatewayHealth> health_;
};

} // namespace gateway_failover
