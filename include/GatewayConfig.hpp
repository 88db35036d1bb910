#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace gateway_failover {

constexpr size_t GATEWAY_COUNT = 3;

using GatewayList = std::array<std::string, GATEWAY_COUNT>;

/**
 * Immutable gateway endpoints and timing constants.
 * The priority order is always primary -> secondary -> fallback.
 */
class GatewayConfig {
public:
	GatewayConfig(std::string primary, std::string secondary, std::string fallback,
				  uint32_t maxRetriesPerGateway = 2, uint64_t baseDelayMs = 300);

	static const GatewayConfig& getDefault();

	const std::string& primary() const { return gateways_[0]; }
	const std::string& secondary() const { return gateways_[1]; }
	const std::string& fallback() const { return gateways_[2]; }

	// One attempt slot per gateway
	uint32_t max_attempts() const { return static_cast<uint32_t>(GATEWAY_COUNT); }
	uint32_t max_retries_per_gateway() const { return maxRetriesPerGateway_; }
	uint64_t base_delay_ms() const { return baseDelayMs_; }

	// Upper bound of HTTP calls for one logical request
	uint32_t max_total_attempts() const { return max_attempts() * (maxRetriesPerGateway_ + 1); }

	const GatewayList& priority_order() const { return gateways_; }

	// Always the configured primary; routing outcomes never change it.
	const std::string& current_gateway() const { return gateways_[0]; }

	nlohmann::json toJson() const;
	// Throws std::invalid_argument on a missing URL or a max_attempts other than the gateway count
	static GatewayConfig fromJson(const nlohmann::json& j);

	bool operator==(const GatewayConfig& other) const;
	bool operator!=(const GatewayConfig& other) const { return !(*this == other); }

private:
	GatewayList gateways_;
	uint32_t maxRetriesPerGateway_;
	uint64_t baseDelayMs_;
};

void to_json(nlohmann::json& j, const GatewayConfig& config);

} // namespace gateway_failover
