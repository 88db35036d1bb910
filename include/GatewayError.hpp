#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace gateway_failover {

/**
 * Error surfaced by the gateway client.
 * what() carries the technical message for logs, userMessage() the short text for UI display.
 */
class GatewayError : public std::runtime_error {
public:
#define GATEWAY_ERROR_KINDS                                                                                            \
	GATEWAY_ERROR_KIND(Network)                                                                                        \
	GATEWAY_ERROR_KIND(Gateway)                                                                                        \
	GATEWAY_ERROR_KIND(AllGatewaysFailed)                                                                              \
	GATEWAY_ERROR_KIND(RateLimitExceeded)                                                                              \
	GATEWAY_ERROR_KIND(ApiTimeout)                                                                                     \
	GATEWAY_ERROR_KIND(InvalidApiResponse)

	enum Kind : uint8_t {
#define GATEWAY_ERROR_KIND(kindName) kindName,
		GATEWAY_ERROR_KINDS
#undef GATEWAY_ERROR_KIND
	};
	static constexpr std::string_view KindStr[] = {
#define GATEWAY_ERROR_KIND(kindName) #kindName,
		GATEWAY_ERROR_KINDS
#undef GATEWAY_ERROR_KIND
	};

	static GatewayError network(const std::string& message);
	static GatewayError gateway(const std::string& message);
	static GatewayError allGatewaysFailed(uint32_t attempts);
	static GatewayError rateLimitExceeded(uint64_t retryAfterSeconds);
	static GatewayError apiTimeout(uint64_t timeoutSeconds);
	static GatewayError invalidApiResponse(const std::string& message);

	Kind kind() const { return kind_; }
	std::string_view kindName() const { return KindStr[kind_]; }

	// Kind-specific fields, zero / empty when not applicable
	const std::string& detail() const { return detail_; }
	uint32_t attempts() const { return attempts_; }
	uint64_t retryAfterSeconds() const { return retryAfterSeconds_; }
	uint64_t timeoutSeconds() const { return timeoutSeconds_; }

	std::string_view category() const;
	std::string userMessage() const;
	bool isRecoverable() const;
	bool isWarningLevel() const;

	nlohmann::json toJson() const;

private:
	GatewayError(Kind kind, const std::string& what);

	Kind kind_;
	std::string detail_;
	uint32_t attempts_ = 0;
	uint64_t retryAfterSeconds_ = 0;
	uint64_t timeoutSeconds_ = 0;
};

} // namespace gateway_failover
