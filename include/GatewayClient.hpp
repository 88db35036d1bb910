#pragma once

#include "GatewayConfig.hpp"
#include "GatewayError.hpp"
#include "GatewayLog.hpp"
#include "HealthTracker.hpp"
#include "RequestExecutor.hpp"
#include "RetryPolicy.hpp"
#include "RetryStrategies.hpp"
#include "models.hpp"

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace gateway_failover {

using SleepFn = std::function<void(std::chrono::milliseconds)>;

struct GatewayClientSettings {
	RetryPolicy retryPolicy;
	SleepFn sleep;							// Backoff wait, std::this_thread::sleep_for when empty
	std::shared_ptr<GatewayLog> gatewayLog; // Optional append-only event log
};

/**
 * Runs one logical call over the three gateways in fixed priority order,
 * retrying each gateway with backoff before failing over to the next.
 *
 * Health records are internally locked, so concurrent calls on one client are allowed.
 */
class GatewayClient {
public:
	GatewayClient();
	explicit GatewayClient(GatewayConfig config, std::shared_ptr<RequestExecutor> executor = nullptr,
						   GatewayClientSettings settings = GatewayClientSettings());

	// non-copyable
	GatewayClient(const GatewayClient&) = delete;
	GatewayClient& operator=(const GatewayClient&) = delete;

	// Throws GatewayError (AllGatewaysFailed) once every gateway is exhausted
	GatewayResponse fetch_with_failover(const GatewayRequest& request);

	// Same call on a separate thread; wait_for() on the future gives callers a deadline
	std::future<GatewayResponse> fetch_async(GatewayRequest request);

	std::vector<GatewayHealth> get_health_stats() const;
	const GatewayConfig& get_gateway_config() const;
	const GatewayList& priority_order() const;
	const std::string& current_gateway() const;

	// {"config": ..., "health": [...]} for diagnostics export
	nlohmann::json diagnostics() const;
	// Appends the diagnostics to the gateway log, if one is attached
	void write_diagnostics() const;

	static std::string_view gatewayRole(size_t gatewayIndex);

private:
	const GatewayConfig config_;
	std::shared_ptr<RequestExecutor> executor_;
	RetryPolicy retryPolicy_;
	SleepFn sleep_;
	std::shared_ptr<GatewayLog> gatewayLog_;
	HealthTracker health_;

	void record(size_t gatewayIndex, const Outcome& outcome, uint64_t elapsedMs);
};

} // namespace gateway_failover
