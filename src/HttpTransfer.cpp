#include "HttpTransfer.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <regex>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace gateway_failover {

// "HTTP/1.1 503 Service Unavailable" -> "Service Unavailable", printable ASCII only
static std::string status_reason(std::string_view statusLine) {
	auto code = statusLine.find(' ');
	if (code == std::string_view::npos)
		return {};
	auto reason = statusLine.find(' ', code + 1);
	if (reason == std::string_view::npos)
		return {};

	std::string out;
	for (char c : util::trim(statusLine.substr(reason + 1)))
		if (c >= 0x20 && c < 0x7f)
			out.push_back(c);
	return out;
}

static void apply_default_settings(CURL* handle) {
	curl_easy_setopt(handle, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_NONE);
	curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 1L);
	curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(handle, CURLOPT_TCP_KEEPALIVE, 1L);
	curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
	curl_easy_setopt(handle, CURLOPT_USE_SSL, CURLUSESSL_TRY);
}

HttpTransfer::HttpTransfer(HttpRequest request, RequestPolicy policy)
	: request(std::move(request)), policy(std::move(policy)) {
	static std::once_flag inited;

	std::call_once(inited, []() {
		auto rc = curl_global_init(CURL_GLOBAL_DEFAULT);
		if (rc != CURLE_OK) throw std::runtime_error("curl_global_init failed");
		std::atexit([] { curl_global_cleanup(); });
	});

	this->curlEasy = curl_easy_init();
	if (!this->curlEasy)
		throw std::runtime_error("curl_easy_init failed");
	this->setup();
}

HttpTransfer::~HttpTransfer() {
	curl_easy_cleanup(this->curlEasy);
	curl_slist_free_all(this->headers_);
}

HttpTransfer::HttpTransfer(HttpTransfer&& other) noexcept
	: curlEasy(std::exchange(other.curlEasy, nullptr)),
	  headers_(std::exchange(other.headers_, nullptr)),
	  contentLength(other.contentLength),
	  request(std::move(other.request)),
	  response(std::move(other.response)),
	  policy(std::move(other.policy)) {
	std::memcpy(this->errorBuffer_, other.errorBuffer_, CURL_ERROR_SIZE);
	this->rebind();
}

HttpTransfer& HttpTransfer::operator=(HttpTransfer&& other) noexcept {
	if (this != &other) {
		curl_easy_cleanup(this->curlEasy);
		curl_slist_free_all(this->headers_);

		this->curlEasy = std::exchange(other.curlEasy, nullptr);
		this->headers_ = std::exchange(other.headers_, nullptr);
		this->contentLength = other.contentLength;
		this->request = std::move(other.request);
		this->response = std::move(other.response);
		this->policy = std::move(other.policy);
		std::memcpy(this->errorBuffer_, other.errorBuffer_, CURL_ERROR_SIZE);

		this->rebind();
	}
	return *this;
}

HttpResponse HttpTransfer::detachResponse() {
	return std::move(this->response);
}

CURLcode HttpTransfer::perform_blocking() {
	CURLcode code = curl_easy_perform(this->curlEasy);
	this->finalize_transfer(code);
	return code;
}

void HttpTransfer::finalize_transfer(CURLcode code) {
	curl_easy_getinfo(this->curlEasy, CURLINFO_RESPONSE_CODE, &this->response.status);

	if (code != CURLE_OK) {
		this->response.error = this->errorBuffer_[0] ? std::string(this->errorBuffer_)
													 : std::string(curl_easy_strerror(code));
	}

	curl_off_t connect = 0, appConnect = 0, preTransfer = 0, startTransfer = 0, total = 0, redir = 0;
	curl_easy_getinfo(this->curlEasy, CURLINFO_CONNECT_TIME_T, &connect);
	curl_easy_getinfo(this->curlEasy, CURLINFO_APPCONNECT_TIME_T, &appConnect);
	curl_easy_getinfo(this->curlEasy, CURLINFO_PRETRANSFER_TIME_T, &preTransfer);
	curl_easy_getinfo(this->curlEasy, CURLINFO_STARTTRANSFER_TIME_T, &startTransfer);
	curl_easy_getinfo(this->curlEasy, CURLINFO_TOTAL_TIME_T, &total);
	curl_easy_getinfo(this->curlEasy, CURLINFO_REDIRECT_TIME_T, &redir);

	// appConnect stays 0 on plain HTTP
	if (appConnect < connect)
		appConnect = connect;

	constexpr float us2s = 1e-6f;
	this->response.transferInfo.connect = connect * us2s;
	this->response.transferInfo.appConnect = (appConnect - connect) * us2s;
	this->response.transferInfo.preTransfer = (preTransfer - appConnect) * us2s;
	this->response.transferInfo.startTransfer = (startTransfer - preTransfer) * us2s;
	this->response.transferInfo.receiveTransfer = (total - startTransfer) * us2s;
	this->response.transferInfo.total = total * us2s;
	this->response.transferInfo.redir = redir * us2s;

	this->response.transferInfo.completeAt = util::current_time();
}

void HttpTransfer::setup() {
	apply_default_settings(this->curlEasy);

	curl_easy_setopt(this->curlEasy, CURLOPT_URL, this->request.url.c_str());
	if (this->policy.timeout > 0)
		curl_easy_setopt(this->curlEasy, CURLOPT_TIMEOUT_MS, static_cast<long>(this->policy.timeout * 1000));
	if (this->policy.connTimeout > 0)
		curl_easy_setopt(this->curlEasy, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(this->policy.connTimeout * 1000));
	if (this->policy.curlBufferSize) {
		long buf_size = std::clamp<long>(this->policy.curlBufferSize, 1024L, static_cast<long>(CURL_MAX_READ_SIZE));
		curl_easy_setopt(this->curlEasy, CURLOPT_BUFFERSIZE, buf_size);
	}

	for (const auto& header : this->request.headers) {
		this->headers_ = curl_slist_append(this->headers_, header.c_str());
	}
	curl_easy_setopt(this->curlEasy, CURLOPT_HTTPHEADER, this->headers_);

	curl_easy_setopt(this->curlEasy, CURLOPT_POST, 1L);
	curl_easy_setopt(this->curlEasy, CURLOPT_POSTFIELDSIZE, static_cast<long>(this->request.body.size()));
	curl_easy_setopt(this->curlEasy, CURLOPT_COPYPOSTFIELDS, this->request.body.c_str());

	curl_easy_setopt(this->curlEasy, CURLOPT_WRITEFUNCTION, HttpTransfer::body_cb);
	curl_easy_setopt(this->curlEasy, CURLOPT_HEADERFUNCTION, HttpTransfer::header_cb);
	this->rebind();
}

// Point libcurl's callback data and error buffer at this object
void HttpTransfer::rebind() {
	if (!this->curlEasy)
		return;
	curl_easy_setopt(this->curlEasy, CURLOPT_WRITEDATA, this);
	curl_easy_setopt(this->curlEasy, CURLOPT_HEADERDATA, this);
	curl_easy_setopt(this->curlEasy, CURLOPT_ERRORBUFFER, this->errorBuffer_);
}

// Callbacks never throw into libcurl; a short count aborts the transfer with CURLE_WRITE_ERROR
size_t HttpTransfer::body_cb(void* ptr, size_t size, size_t nmemb, void* data) {
	HttpTransfer* transfer = static_cast<HttpTransfer*>(data);
	try {
		const size_t wanted = std::min(transfer->contentLength, MAX_PREALLOCATION);
		if (wanted > transfer->response.body.capacity())
			transfer->response.body.reserve(wanted);

		transfer->response.body.append(static_cast<const char*>(ptr), size * nmemb);
		return size * nmemb;
	} catch (const std::exception&) {
		return 0;
	}
}

size_t HttpTransfer::header_cb(void* ptr, size_t size, size_t nmemb, void* data) {
	HttpTransfer* transfer = static_cast<HttpTransfer*>(data);

	const size_t len = size * nmemb;
	if (!ptr || len == 0)
		return len;

	std::string_view sv(static_cast<const char*>(ptr), len);

	if (!sv.empty() && sv.back() == '\n')
		sv.remove_suffix(1);
	if (!sv.empty() && sv.back() == '\r')
		sv.remove_suffix(1);

	if (sv.empty())
		return len;

	try {
		// A new status line starts a new header block (redirects, 100-continue)
		if (sv.rfind("HTTP/", 0) == 0) {
			transfer->response.headers.clear();
			transfer->response.reason = status_reason(sv);
			transfer->contentLength = 0;
			return len;
		}

		transfer->response.headers.emplace_back(sv);

		// Parse content-length for pre-allocation
		static const std::regex contentLengthRegex("^content-length:\\s*(\\d+)", std::regex::icase);
		std::match_results<std::string_view::const_iterator> match;
		if (std::regex_search(sv.begin(), sv.end(), match, contentLengthRegex)) {
			transfer->contentLength = std::strtoul(match[1].str().c_str(), nullptr, 10);
		}
	} catch (const std::exception&) {
		return 0;
	}

	return len;
}

} // namespace gateway_failover
