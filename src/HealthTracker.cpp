#include "HealthTracker.hpp"

#include <stdexcept>
#include <string>

namespace gateway_failover {

HealthTracker::HealthTracker(const GatewayList& gateways) {
	this->health_.reserve(gateways.size());
	for (const auto& url : gateways) {
		GatewayHealth health;
		health.url = url;
		this->health_.push_back(std::move(health));
	}
}

void HealthTracker::record_attempt(size_t gatewayIndex, const Outcome& outcome, uint64_t elapsedMs) {
	std::lock_guard<std::mutex> lk(this->mutex_);

	if (gatewayIndex >= this->health_.size())
		throw std::out_of_range("HealthTracker: gateway index " + std::to_string(gatewayIndex) + " out of range");

	GatewayHealth& health = this->health_[gatewayIndex];
	health.response_time_ms = elapsedMs;

	if (outcome.isSuccess()) {
		health.status = HealthStatus::Healthy;
		health.last_success = util::unix_timestamp();
		health.last_error.reset();
	} else {
		health.status = HealthStatus::Unhealthy;
		health.last_error = outcome.describe();
	}
}

std::vector<GatewayHealth> HealthTracker::snapshot() const {
	std::lock_guard<std::mutex> lk(this->mutex_);
	return this->health_;
}

GatewayHealth HealthTracker::at(size_t gatewayIndex) const {
	std::lock_guard<std::mutex> lk(this->mutex_);
	return this->health_.at(gatewayIndex);
}

size_t HealthTracker::size() const {
	std::lock_guard<std::mutex> lk(this->mutex_);
	return this->health_.size();
}

} // namespace gateway_failover
