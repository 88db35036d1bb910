#pragma once

#include "GatewayConfig.hpp"
#include "GatewayError.hpp"
#include "models.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace spdlog {
class logger;
}

namespace gateway_failover {

/**
 * Append-only gateway event log, one "<time> | <event>" line per entry.
 */
class GatewayLog {
public:
	static constexpr const char* DEFAULT_PATH = "logs/gateway.log";

	// Opens (and creates) the file for appending; throws spdlog::spdlog_ex on failure
	explicit GatewayLog(const std::string& path = DEFAULT_PATH);
	~GatewayLog();

	GatewayLog(const GatewayLog&) = delete;
	GatewayLog& operator=(const GatewayLog&) = delete;

	const std::string& path() const { return path_; }

	void attempt(const std::string& gatewayUrl, bool success, const std::string& message, uint64_t elapsedMs);
	void health(const std::string& gatewayUrl, bool healthy, uint64_t elapsedMs);
	void rateLimited(const std::string& gatewayUrl, uint64_t retryAfterSeconds);
	void allFailed(uint32_t attempts, size_t gatewayCount, const GatewayError& error);
	void diagnostics(const GatewayConfig& config, const std::vector<GatewayHealth>& health);

	void flush();

private:
	std::string path_;
	std::shared_ptr<spdlog::logger> logger_;
};

} // namespace gateway_failover
