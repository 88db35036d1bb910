#include "GatewayConfig.hpp"

#include <stdexcept>
#include <utility>

namespace gateway_failover {

GatewayConfig::GatewayConfig(std::string primary, std::string secondary, std::string fallback,
							 uint32_t maxRetriesPerGateway, uint64_t baseDelayMs)
	: gateways_{std::move(primary), std::move(secondary), std::move(fallback)},
	  maxRetriesPerGateway_(maxRetriesPerGateway),
	  baseDelayMs_(baseDelayMs) {
	for (const auto& url : this->gateways_) {
		if (url.empty())
			throw std::invalid_argument("GatewayConfig: gateway URL must not be empty");
	}
}

const GatewayConfig& GatewayConfig::getDefault() {
	static const GatewayConfig defaultConfig(
		"https://api.na-backend.odysee.com/api/v1/proxy",
		"https://api.lbry.tv/api/v1/proxy",
		"https://api.odysee.com/api/v1/proxy");
	return defaultConfig;
}

nlohmann::json GatewayConfig::toJson() const {
	return nlohmann::json{
		{"primary", this->primary()},
		{"secondary", this->secondary()},
		{"fallback", this->fallback()},
		{"max_attempts", this->max_attempts()},
		{"max_retries_per_gateway", this->maxRetriesPerGateway_},
		{"base_delay_ms", this->baseDelayMs_},
	};
}

GatewayConfig GatewayConfig::fromJson(const nlohmann::json& j) {
	try {
		auto maxAttempts = j.at("max_attempts").get<uint32_t>();
		if (maxAttempts != GATEWAY_COUNT)
			throw std::invalid_argument("GatewayConfig: max_attempts must equal the gateway count (" +
										std::to_string(GATEWAY_COUNT) + "), got " + std::to_string(maxAttempts));

		return GatewayConfig(
			j.at("primary").get<std::string>(),
			j.at("secondary").get<std::string>(),
			j.at("fallback").get<std::string>(),
			j.at("max_retries_per_gateway").get<uint32_t>(),
			j.at("base_delay_ms").get<uint64_t>());
	} catch (const nlohmann::json::exception& e) {
		throw std::invalid_argument(std::string("GatewayConfig: ") + e.what());
	}
}

bool GatewayConfig::operator==(const GatewayConfig& other) const {
	return this->gateways_ == other.gateways_ &&
		   this->maxRetriesPerGateway_ == other.maxRetriesPerGateway_ &&
		   this->baseDelayMs_ == other.baseDelayMs_;
}

void to_json(nlohmann::json& j, const GatewayConfig& config) {
	j = config.toJson();
}

} // namespace gateway_failover
