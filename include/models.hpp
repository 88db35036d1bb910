#pragma once

#include "utils.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#ifdef __cplusplus
extern "C" {
#endif
#include <curl/curl.h>
#ifdef __cplusplus
}
#endif

namespace gateway_failover {

// ============ HTTP transfer ============

struct RequestPolicy {
	float timeout = 10;		// per-request timeout in seconds (<=0 means wait indefinitely)
	float connTimeout = 0;	// optional connection (DNS + handshake) timeout in seconds (<=0 means libcurl default)

	uint32_t curlBufferSize = CURL_MAX_WRITE_SIZE; // in bytes
};

struct HttpRequest {
	std::string url;
	std::vector<std::string> headers; // e.g. "Content-Type: application/json"
	std::string body;				  // POST body
};

struct TransferInfo {
	// In second
	float connect = 0, appConnect = 0, preTransfer = 0, startTransfer = 0, receiveTransfer = 0, total = 0, redir = 0;
	float completeAt = 0;
};

struct HttpResponse {
	long status = 0;
	std::string reason; // status line reason phrase, empty on HTTP/2

	std::vector<std::string> headers;
	std::string body;
	std::string error; // non-empty on transport error

	TransferInfo transferInfo;
};

// ============ Gateway API ============

struct GatewayRequest {
	std::string method;		// e.g. "claim_search", "resolve"
	nlohmann::json params = nlohmann::json::object();
};

struct GatewayResponse {
	bool success = false;
	std::optional<std::string> error;
	std::optional<nlohmann::json> data;
};

enum class HealthStatus : uint8_t { Unknown, Healthy, Unhealthy };

std::string_view to_string(HealthStatus status);
HealthStatus health_status_from_string(std::string_view name);

struct GatewayHealth {
	std::string url;
	HealthStatus status = HealthStatus::Unknown;
	std::optional<int64_t> last_success;		// unix seconds
	std::optional<std::string> last_error;
	std::optional<uint64_t> response_time_ms;
};

void to_json(nlohmann::json& j, const GatewayRequest& request);
void from_json(const nlohmann::json& j, GatewayRequest& request);

void to_json(nlohmann::json& j, const GatewayResponse& response);
// Throws nlohmann::json::exception if the envelope is malformed
void from_json(const nlohmann::json& j, GatewayResponse& response);

void to_json(nlohmann::json& j, const GatewayHealth& health);
void from_json(const nlohmann::json& j, GatewayHealth& health);

} // namespace gateway_failover
