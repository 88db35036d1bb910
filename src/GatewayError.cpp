#include "GatewayError.hpp"

namespace gateway_failover {

GatewayError::GatewayError(Kind kind, const std::string& what) : std::runtime_error(what), kind_(kind) {}

GatewayError GatewayError::network(const std::string& message) {
	GatewayError error(Network, "Network error: " + message);
	error.detail_ = message;
	return error;
}

GatewayError GatewayError::gateway(const std::string& message) {
	GatewayError error(Gateway, "Gateway error: " + message);
	error.detail_ = message;
	return error;
}

GatewayError GatewayError::allGatewaysFailed(uint32_t attempts) {
	GatewayError error(AllGatewaysFailed, "All gateways failed after " + std::to_string(attempts) + " attempts");
	error.attempts_ = attempts;
	return error;
}

GatewayError GatewayError::rateLimitExceeded(uint64_t retryAfterSeconds) {
	GatewayError error(RateLimitExceeded,
		"API rate limit exceeded: retry after " + std::to_string(retryAfterSeconds) + " seconds");
	error.retryAfterSeconds_ = retryAfterSeconds;
	return error;
}

GatewayError GatewayError::apiTimeout(uint64_t timeoutSeconds) {
	GatewayError error(ApiTimeout,
		"API timeout: operation took longer than " + std::to_string(timeoutSeconds) + " seconds");
	error.timeoutSeconds_ = timeoutSeconds;
	return error;
}

GatewayError GatewayError::invalidApiResponse(const std::string& message) {
	GatewayError error(InvalidApiResponse, "Invalid API response: " + message);
	error.detail_ = message;
	return error;
}

std::string_view GatewayError::category() const {
	// Every kind the client raises is a network concern
	return "network";
}

std::string GatewayError::userMessage() const {
	switch (this->kind_) {
		case Network:
			return "Network connection failed. Please check your internet connection.";
		case AllGatewaysFailed:
			return "All servers are currently unavailable. Please try again later.";
		case RateLimitExceeded:
			return "Too many requests. Please wait " + std::to_string(this->retryAfterSeconds_) +
				   " seconds before trying again.";
		default:
			return "An unexpected error occurred. Please try again.";
	}
}

bool GatewayError::isRecoverable() const {
	switch (this->kind_) {
		case Network:
		case Gateway:
		case ApiTimeout:
		case RateLimitExceeded:
			return true;
		default:
			return false;
	}
}

bool GatewayError::isWarningLevel() const {
	return this->kind_ == RateLimitExceeded;
}

nlohmann::json GatewayError::toJson() const {
	nlohmann::json j = {
		{"kind", std::string(this->kindName())},
		{"category", std::string(this->category())},
		{"message", this->what()},
		{"user_message", this->userMessage()},
		{"recoverable", this->isRecoverable()},
	};

	switch (this->kind_) {
		case AllGatewaysFailed:
			j["attempts"] = this->attempts_;
			break;
		case RateLimitExceeded:
			j["retry_after_seconds"] = this->retryAfterSeconds_;
			break;
		case ApiTimeout:
			j["timeout_seconds"] = this->timeoutSeconds_;
			break;
		default:
			j["detail"] = this->detail_;
	}
	return j;
}

} // namespace gateway_failover
