#pragma once

#include "models.hpp"

#include <cstddef>
#include <string>

#ifdef __cplusplus
extern "C" {
#endif
#include <curl/curl.h>
#ifdef __cplusplus
}
#endif

namespace gateway_failover {

/**
 * One blocking HTTP POST on its own libcurl easy handle.
 * Not thread-safe; use one transfer per attempt.
 */
class HttpTransfer {
public:
	// Upper bound for reserving the body from a Content-Length header
	static constexpr size_t MAX_PREALLOCATION = 4 * 1024 * 1024;

	explicit HttpTransfer(HttpRequest request, RequestPolicy policy = RequestPolicy());
	~HttpTransfer();

	// Moveable, Not copyable
	HttpTransfer(const HttpTransfer&) = delete;
	HttpTransfer& operator=(const HttpTransfer&) = delete;
	HttpTransfer(HttpTransfer&& other) noexcept;
	HttpTransfer& operator=(HttpTransfer&& other) noexcept;

	HttpResponse detachResponse();

	// Returns the libcurl result; the response is filled either way
	CURLcode perform_blocking();

private:
	CURL* curlEasy = nullptr;
	struct curl_slist* headers_ = nullptr;
	size_t contentLength = 0;
	char errorBuffer_[CURL_ERROR_SIZE] = {0};

	HttpRequest request;
	HttpResponse response;
	RequestPolicy policy;

	void setup();
	void finalize_transfer(CURLcode code);
	void rebind();

	static size_t body_cb(void* ptr, size_t size, size_t nmemb, void* data);
	static size_t header_cb(void* ptr, size_t size, size_t nmemb, void* data);
};

} // namespace gateway_failover
