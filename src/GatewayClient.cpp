#include "GatewayClient.hpp"

#include <algorithm>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

namespace gateway_failover {

static std::string attempt_label(uint32_t retryIndex, uint32_t maxRetries) {
	if (retryIndex == 0)
		return "initial attempt";
	return "retry " + std::to_string(retryIndex) + "/" + std::to_string(maxRetries);
}

GatewayClient::GatewayClient() : GatewayClient(GatewayConfig::getDefault()) {}

GatewayClient::GatewayClient(GatewayConfig config, std::shared_ptr<RequestExecutor> executor,
							 GatewayClientSettings settings)
	: config_(std::move(config)),
	  executor_(executor ? std::move(executor)
						  : std::shared_ptr<RequestExecutor>(std::make_shared<CurlRequestExecutor>())),
	  retryPolicy_(std::move(settings.retryPolicy)),
	  sleep_(std::move(settings.sleep)),
	  gatewayLog_(std::move(settings.gatewayLog)),
	  health_(config_.priority_order()) {
	if (!this->sleep_)
		this->sleep_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

std::string_view GatewayClient::gatewayRole(size_t gatewayIndex) {
	switch (gatewayIndex) {
		case 0:
			return "PRIMARY";
		case 1:
			return "SECONDARY";
		case 2:
			return "FALLBACK";
		default:
			return "UNKNOWN";
	}
}

GatewayResponse GatewayClient::fetch_with_failover(const GatewayRequest& request) {
	const GatewayList& gateways = this->config_.priority_order();
	const uint32_t maxRetries = this->config_.max_retries_per_gateway();
	const size_t gatewayCount = std::min<size_t>(this->config_.max_attempts(), gateways.size());

	RetryContext context;
	context.first_attempt_at = util::current_time();

	for (size_t gatewayIndex = 0; gatewayIndex < gatewayCount; ++gatewayIndex) {
		const std::string& gatewayUrl = gateways[gatewayIndex];
		spdlog::info("Trying gateway {} of {}: {} ({})", gatewayIndex + 1, gatewayCount, gatewayUrl,
					 gatewayRole(gatewayIndex));

		for (uint32_t retryIndex = 0; retryIndex <= maxRetries; ++retryIndex) {
			const std::string label = attempt_label(retryIndex, maxRetries);
			spdlog::info("Gateway {} ({}): {} (total attempt {})", gatewayUrl, gatewayRole(gatewayIndex), label,
						 context.attemptCount() + 1);

			auto start = std::chrono::steady_clock::now();
			Outcome outcome = this->executor_->execute(gatewayUrl, request);
			const uint64_t elapsedMs = static_cast<uint64_t>(
				std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count());

			this->record(gatewayIndex, outcome, elapsedMs);
			context.attempts.push_back(
				AttemptRecord{gatewayIndex, retryIndex, outcome.kind, elapsedMs, util::current_time()});

			if (outcome.isSuccess()) {
				spdlog::info("Gateway {} ({}) succeeded on {} after {}ms (total attempts: {})", gatewayUrl,
							 gatewayRole(gatewayIndex), label, elapsedMs, context.attemptCount());
				return std::move(*outcome.response);
			}

			const bool retryable = this->retryPolicy_.shouldRetry && this->retryPolicy_.shouldRetry(context);
			spdlog::warn("Gateway {} ({}) failed on {} after {}ms: {} (retryable: {})", gatewayUrl,
						 gatewayRole(gatewayIndex), label, elapsedMs, outcome.describe(), retryable);

			if (!retryable || retryIndex >= maxRetries) {
				spdlog::info("Moving to next gateway after {} attempts on {}", context.attemptsOn(gatewayIndex),
							 gatewayUrl);
				break;
			}

			auto delay = this->retryPolicy_.retryDelay ? this->retryPolicy_.retryDelay(retryIndex)
													   : std::chrono::milliseconds(0);
			spdlog::info("Retrying gateway {} in {}ms (retry {}/{})", gatewayUrl, delay.count(), retryIndex + 1,
						 maxRetries);
			this->sleep_(delay);
		}

		if (gatewayIndex + 1 < gatewayCount) {
			auto delay = this->retryPolicy_.failoverDelay
							 ? this->retryPolicy_.failoverDelay(static_cast<uint32_t>(gatewayIndex))
							 : std::chrono::milliseconds(0);
			spdlog::info("Gateway {} ({}) exhausted, failing over to next gateway in {}ms", gatewayUrl,
						 gatewayRole(gatewayIndex), delay.count());
			this->sleep_(delay);
		}
	}

	GatewayError error = GatewayError::allGatewaysFailed(context.attemptCount());
	spdlog::error("All {} gateways failed after {} total attempts in {:.2f}s", gatewayCount, context.attemptCount(),
				  util::current_time() - context.first_attempt_at);
	if (this->gatewayLog_)
		this->gatewayLog_->allFailed(context.attemptCount(), gatewayCount, error);

	throw error;
}

std::future<GatewayResponse> GatewayClient::fetch_async(GatewayRequest request) {
	return std::async(std::launch::async, [this, request = std::move(request)]() {
		return this->fetch_with_failover(request);
	});
}

void GatewayClient::record(size_t gatewayIndex, const Outcome& outcome, uint64_t elapsedMs) {
	this->health_.record_attempt(gatewayIndex, outcome, elapsedMs);

	if (!this->gatewayLog_)
		return;

	const std::string& gatewayUrl = this->config_.priority_order()[gatewayIndex];
	if (outcome.isSuccess())
		this->gatewayLog_->attempt(gatewayUrl, true, "Response time: " + std::to_string(elapsedMs) + "ms", elapsedMs);
	else
		this->gatewayLog_->attempt(gatewayUrl, false, outcome.describe(), elapsedMs);
	if (outcome.kind == Outcome::RateLimited)
		this->gatewayLog_->rateLimited(gatewayUrl, outcome.retryAfterSeconds);
	this->gatewayLog_->health(gatewayUrl, outcome.isSuccess(), elapsedMs);
}

std::vector<GatewayHealth> GatewayClient::get_health_stats() const {
	return this->health_.snapshot();
}

const GatewayConfig& GatewayClient::get_gateway_config() const {
	return this->config_;
}

const GatewayList& GatewayClient::priority_order() const {
	return this->config_.priority_order();
}

const std::string& GatewayClient::current_gateway() const {
	return this->config_.current_gateway();
}

nlohmann::json GatewayClient::diagnostics() const {
	return nlohmann::json{
		{"config", this->config_.toJson()},
		{"health", this->health_.snapshot()},
	};
}

void GatewayClient::write_diagnostics() const {
	if (this->gatewayLog_)
		this->gatewayLog_->diagnostics(this->config_, this->health_.snapshot());
}

} // namespace gateway_failover
