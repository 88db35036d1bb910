#pragma once

#include "GatewayError.hpp"
#include "models.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace gateway_failover {

// Retry-After fallback when a 429 carries no usable hint
constexpr uint64_t DEFAULT_RETRY_AFTER_SECONDS = 60;

/**
 * Classified result of exactly one HTTP attempt against one gateway.
 */
struct Outcome {
#define GATEWAY_OUTCOME_KINDS                                                                                          \
	GATEWAY_OUTCOME_KIND(Success)                                                                                      \
	GATEWAY_OUTCOME_KIND(RateLimited)                                                                                  \
	GATEWAY_OUTCOME_KIND(Timeout)                                                                                      \
	GATEWAY_OUTCOME_KIND(TransportError)                                                                               \
	GATEWAY_OUTCOME_KIND(ServerError)

	enum Kind : uint8_t {
#define GATEWAY_OUTCOME_KIND(kindName) kindName,
		GATEWAY_OUTCOME_KINDS
#undef GATEWAY_OUTCOME_KIND
	};
	static constexpr std::string_view KindStr[] = {
#define GATEWAY_OUTCOME_KIND(kindName) #kindName,
		GATEWAY_OUTCOME_KINDS
#undef GATEWAY_OUTCOME_KIND
	};

	Kind kind = TransportError;

	std::optional<GatewayResponse> response;	// Success only
	long status = 0;							// HTTP status when one was received
	uint64_t retryAfterSeconds = 0;				// RateLimited only
	uint64_t timeoutSeconds = 0;				// Timeout only
	std::string message;						// TransportError / ServerError
	bool invalidPayload = false;				// ServerError from an unparseable 2xx body

	static Outcome success(GatewayResponse response, long status = 200) {
		Outcome o;
		o.kind = Success;
		o.status = status;
		o.response = std::move(response);
		return o;
	}

	static Outcome rateLimited(uint64_t retryAfterSeconds) {
		Outcome o;
		o.kind = RateLimited;
		o.status = 429;
		o.retryAfterSeconds = retryAfterSeconds;
		return o;
	}

	static Outcome timeout(uint64_t timeoutSeconds, long status = 0) {
		Outcome o;
		o.kind = Timeout;
		o.status = status;
		o.timeoutSeconds = timeoutSeconds;
		return o;
	}

	static Outcome transportError(std::string message) {
		Outcome o;
		o.kind = TransportError;
		o.message = std::move(message);
		return o;
	}

	static Outcome serverError(long status, std::string message, bool invalidPayload = false) {
		Outcome o;
		o.kind = ServerError;
		o.status = status;
		o.message = std::move(message);
		o.invalidPayload = invalidPayload;
		return o;
	}

	bool isSuccess() const { return kind == Success; }
	std::string_view kindName() const { return KindStr[kind]; }

	// Error equivalent of a failure outcome. Must not be called on Success.
	GatewayError toError() const {
		switch (kind) {
			case RateLimited:
				return GatewayError::rateLimitExceeded(retryAfterSeconds);
			case Timeout:
				return GatewayError::apiTimeout(timeoutSeconds);
			case TransportError:
				return GatewayError::network(message);
			case ServerError:
				return invalidPayload ? GatewayError::invalidApiResponse(message) : GatewayError::gateway(message);
			default:
				throw std::logic_error("Outcome::toError called on a successful outcome");
		}
	}

	// Text recorded as a gateway's last_error
	std::string describe() const {
		return isSuccess() ? std::string() : std::string(toError().what());
	}
};

} // namespace gateway_failover
