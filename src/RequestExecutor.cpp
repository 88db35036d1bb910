#include "RequestExecutor.hpp"
#include "HttpTransfer.hpp"

#include <cctype>
#include <limits>
#include <utility>

#include <spdlog/spdlog.h>

namespace gateway_failover {

RequestPolicy CurlRequestExecutor::defaultPolicy() {
	RequestPolicy policy;
	policy.timeout = static_cast<float>(REQUEST_TIMEOUT_SECONDS);
	return policy;
}

CurlRequestExecutor::CurlRequestExecutor(RequestPolicy policy) : policy_(std::move(policy)) {}

Outcome CurlRequestExecutor::execute(const std::string& gatewayUrl, const GatewayRequest& request) {
	HttpRequest httpRequest;
	httpRequest.url = gatewayUrl;
	httpRequest.headers = {"Content-Type: application/json", "Accept: application/json"};
	// Invalid UTF-8 in caller params is sent as U+FFFD instead of failing the call
	httpRequest.body = nlohmann::json(request).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

	HttpTransfer transfer(std::move(httpRequest), this->policy_);
	CURLcode code = transfer.perform_blocking();
	HttpResponse response = transfer.detachResponse();

	const TransferInfo& info = response.transferInfo;
	spdlog::debug("{} -> HTTP {} in {:.3f}s (connect {:.3f}s, tls {:.3f}s, first byte {:.3f}s)", gatewayUrl,
				  response.status, info.total, info.connect, info.appConnect, info.startTransfer);

	const uint64_t timeoutSeconds = this->policy_.timeout > 0 ? static_cast<uint64_t>(this->policy_.timeout)
															  : REQUEST_TIMEOUT_SECONDS;
	Outcome outcome = classify(response, code, timeoutSeconds);

	if (outcome.kind == Outcome::RateLimited)
		spdlog::warn("Rate limit exceeded on {}: retry after {} seconds", gatewayUrl, outcome.retryAfterSeconds);
	else if (outcome.kind == Outcome::Timeout)
		spdlog::warn("Request to {} timed out after {} seconds", gatewayUrl, timeoutSeconds);

	return outcome;
}

Outcome CurlRequestExecutor::classify(const HttpResponse& response, CURLcode code, uint64_t timeoutSeconds) {
	if (code == CURLE_OPERATION_TIMEDOUT)
		return Outcome::timeout(timeoutSeconds);

	if (code != CURLE_OK)
		return Outcome::transportError(response.error.empty() ? curl_easy_strerror(code) : response.error);

	const long status = response.status;

	if (status == 429)
		return Outcome::rateLimited(parseRetryAfter(response.headers).value_or(DEFAULT_RETRY_AFTER_SECONDS));

	if (status == 408)
		return Outcome::timeout(timeoutSeconds, status);

	if (status < 200 || status >= 300) {
		std::string message = "HTTP " + std::to_string(status);
		if (!response.reason.empty())
			message += ": " + response.reason;
		return Outcome::serverError(status, message);
	}

	GatewayResponse gatewayResponse;
	try {
		gatewayResponse = nlohmann::json::parse(response.body).get<GatewayResponse>();
	} catch (const nlohmann::json::parse_error& e) {
		// what() quotes the offending bytes, which need not be valid UTF-8
		return Outcome::serverError(status, "malformed JSON at byte " + std::to_string(e.byte) + " (parse_error." +
												std::to_string(e.id) + ")", true);
	} catch (const nlohmann::json::exception& e) {
		return Outcome::serverError(status, e.what(), true);
	}

	if (!gatewayResponse.success)
		return Outcome::serverError(status, gatewayResponse.error.value_or("Unknown API error"));

	return Outcome::success(std::move(gatewayResponse), status);
}

std::optional<uint64_t> CurlRequestExecutor::parseRetryAfter(const std::vector<std::string>& headers) {
	auto value = util::find_header(headers, "retry-after");
	if (!value || value->empty())
		return std::nullopt;

	uint64_t seconds = 0;
	for (char c : *value) {
		if (!std::isdigit(static_cast<unsigned char>(c)))
			return std::nullopt; // HTTP-date form or garbage
		const uint64_t digit = static_cast<uint64_t>(c - '0');
		if (seconds > (std::numeric_limits<uint64_t>::max() - digit) / 10)
			return std::nullopt;
		seconds = seconds * 10 + digit;
	}
	return seconds;
}

} // namespace gateway_failover
