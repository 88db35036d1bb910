#include "GatewayLog.hpp"

#include <atomic>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

namespace gateway_failover {

GatewayLog::GatewayLog(const std::string& path) : path_(path) {
	// Loggers are not registered globally, the name only has to be readable
	static std::atomic<unsigned> instances{0};
	auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false);
	this->logger_ = std::make_shared<spdlog::logger>("gateway_log_" + std::to_string(instances++), std::move(sink));
	this->logger_->set_pattern("%Y-%m-%dT%H:%M:%S.%e%z | %v");
	this->logger_->set_level(spdlog::level::trace);
	this->logger_->flush_on(spdlog::level::trace);
}

GatewayLog::~GatewayLog() {
	this->logger_->flush();
}

void GatewayLog::attempt(const std::string& gatewayUrl, bool success, const std::string& message, uint64_t elapsedMs) {
	if (success)
		this->logger_->info("SUCCESS | {} | {}ms | {}", gatewayUrl, elapsedMs, message);
	else
		this->logger_->error("FAILURE | {} | {}ms | {}", gatewayUrl, elapsedMs, message);
}

void GatewayLog::health(const std::string& gatewayUrl, bool healthy, uint64_t elapsedMs) {
	this->logger_->info("HEALTH_CHECK | {} | {} | {}ms", healthy ? "HEALTHY" : "UNHEALTHY", gatewayUrl, elapsedMs);
}

void GatewayLog::allFailed(uint32_t attempts, size_t gatewayCount, const GatewayError& error) {
	this->logger_->error("ALL_FAILED | {} attempts across {} gateways | {}", attempts, gatewayCount, error.what());
}

void GatewayLog::rateLimited(const std::string& gatewayUrl, uint64_t retryAfterSeconds) {
	this->logger_->warn("RATE_LIMITED | {} | retry after {} seconds", gatewayUrl, retryAfterSeconds);
}

void GatewayLog::diagnostics(const GatewayConfig& config, const std::vector<GatewayHealth>& health) {
	constexpr auto replace = nlohmann::json::error_handler_t::replace;
	this->logger_->info("CONFIG | {}", config.toJson().dump(-1, ' ', false, replace));
	this->logger_->info("HEALTH | {}", nlohmann::json(health).dump(-1, ' ', false, replace));
}

void GatewayLog::flush() {
	this->logger_->flush();
}

} // namespace gateway_failover
