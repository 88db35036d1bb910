#pragma once

#include "Outcome.hpp"
#include "models.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#ifdef __cplusplus
extern "C" {
#endif
#include <curl/curl.h>
#ifdef __cplusplus
}
#endif

namespace gateway_failover {

/**
 * Performs exactly one call against one gateway and classifies the result.
 * Implementations never retry.
 */
class RequestExecutor {
public:
	virtual ~RequestExecutor() = default;

	virtual Outcome execute(const std::string& gatewayUrl, const GatewayRequest& request) = 0;
};

/**
 * libcurl-backed executor: one JSON POST per call with a fixed request timeout.
 * Every call uses its own transfer, so one instance may be shared between threads.
 */
class CurlRequestExecutor : public RequestExecutor {
public:
	static constexpr uint64_t REQUEST_TIMEOUT_SECONDS = 10;

	static RequestPolicy defaultPolicy();

	explicit CurlRequestExecutor(RequestPolicy policy = defaultPolicy());

	Outcome execute(const std::string& gatewayUrl, const GatewayRequest& request) override;

	// Maps a finished transfer to an Outcome; exposed so it can be checked without a network.
	static Outcome classify(const HttpResponse& response, CURLcode code,
							uint64_t timeoutSeconds = REQUEST_TIMEOUT_SECONDS);

	// Integer-seconds Retry-After value, nullopt when absent or not a plain number
	static std::optional<uint64_t> parseRetryAfter(const std::vector<std::string>& headers);

private:
	RequestPolicy policy_;
};

} // namespace gateway_failover
