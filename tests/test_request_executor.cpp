#include <catch2/catch.hpp>

#include "RequestExecutor.hpp"
#include "loopback_server.hpp"

#include <string>
#include <vector>

using namespace gateway_failover;

namespace {

HttpResponse responseWith(long status, std::string body, std::vector<std::string> headers = {}) {
	HttpResponse response;
	response.status = status;
	response.body = std::move(body);
	response.headers = std::move(headers);
	return response;
}

} // namespace

TEST_CASE("Successful envelope", "[executor]") {
	auto outcome = CurlRequestExecutor::classify(
		responseWith(200, R"({"success":true,"error":null,"data":{"items":[1,2,3]}})"), CURLE_OK);

	REQUIRE(outcome.kind == Outcome::Success);
	REQUIRE(outcome.status == 200);
	REQUIRE(outcome.response.has_value());
	REQUIRE(outcome.response->success);
	REQUIRE_FALSE(outcome.response->error.has_value());
	REQUIRE((*outcome.response->data)["items"].size() == 3);
}

TEST_CASE("Envelope reporting failure is a server error", "[executor]") {
	SECTION("with an error text") {
		auto outcome = CurlRequestExecutor::classify(
			responseWith(200, R"({"success":false,"error":"claim not found","data":null})"), CURLE_OK);
		REQUIRE(outcome.kind == Outcome::ServerError);
		REQUIRE(outcome.message == "claim not found");
		REQUIRE_FALSE(outcome.invalidPayload);
	}

	SECTION("without an error text") {
		auto outcome = CurlRequestExecutor::classify(responseWith(200, R"({"success":false})"), CURLE_OK);
		REQUIRE(outcome.kind == Outcome::ServerError);
		REQUIRE(outcome.message == "Unknown API error");
	}
}

TEST_CASE("Invalid payload messages stay valid UTF-8", "[executor]") {
	auto outcome = CurlRequestExecutor::classify(responseWith(200, "\xff\xfe garbage"), CURLE_OK);

	REQUIRE(outcome.kind == Outcome::ServerError);
	REQUIRE(outcome.invalidPayload);
	REQUIRE_THAT(outcome.message, Catch::Matchers::StartsWith("malformed JSON at byte "));
	REQUIRE(outcome.message.find('\xff') == std::string::npos);

	nlohmann::json j = outcome.describe();
	REQUIRE_NOTHROW(j.dump());
}

TEST_CASE("Unparseable 2xx bodies are invalid payloads", "[executor]") {
	for (const char* body : {"<html>bad gateway</html>", "", R"({"data":{}})", R"({"success":"yes"})"}) {
		auto outcome = CurlRequestExecutor::classify(responseWith(200, body), CURLE_OK);
		INFO("body: " << body);
		REQUIRE(outcome.kind == Outcome::ServerError);
		REQUIRE(outcome.invalidPayload);
		REQUIRE(outcome.toError().kind() == GatewayError::InvalidApiResponse);
	}
}

TEST_CASE("HTTP 429 is rate limited", "[executor]") {
	SECTION("Retry-After seconds are honoured") {
		auto outcome = CurlRequestExecutor::classify(responseWith(429, "", {"Retry-After: 30"}), CURLE_OK);
		REQUIRE(outcome.kind == Outcome::RateLimited);
		REQUIRE(outcome.retryAfterSeconds == 30);
	}

	SECTION("header name is case-insensitive") {
		auto outcome = CurlRequestExecutor::classify(responseWith(429, "", {"retry-after:  5 "}), CURLE_OK);
		REQUIRE(outcome.retryAfterSeconds == 5);
	}

	SECTION("missing header falls back to 60 seconds") {
		auto outcome = CurlRequestExecutor::classify(responseWith(429, "{}", {"Content-Type: text/plain"}), CURLE_OK);
		REQUIRE(outcome.kind == Outcome::RateLimited);
		REQUIRE(outcome.retryAfterSeconds == DEFAULT_RETRY_AFTER_SECONDS);
	}

	SECTION("HTTP-date form falls back to 60 seconds") {
		auto outcome = CurlRequestExecutor::classify(
			responseWith(429, "", {"Retry-After: Wed, 21 Oct 2015 07:28:00 GMT"}), CURLE_OK);
		REQUIRE(outcome.retryAfterSeconds == 60);
	}
}

TEST_CASE("Retry-After parsing", "[executor]") {
	REQUIRE(CurlRequestExecutor::parseRetryAfter({"Retry-After: 120"}) == uint64_t(120));
	REQUIRE(CurlRequestExecutor::parseRetryAfter({"RETRY-AFTER: 0"}) == uint64_t(0));
	REQUIRE_FALSE(CurlRequestExecutor::parseRetryAfter({}).has_value());
	REQUIRE_FALSE(CurlRequestExecutor::parseRetryAfter({"Retry-After: -1"}).has_value());
	REQUIRE_FALSE(CurlRequestExecutor::parseRetryAfter({"Retry-After: 1.5"}).has_value());
	REQUIRE_FALSE(CurlRequestExecutor::parseRetryAfter({"Retry-After: 99999999999999999999999"}).has_value());
}

TEST_CASE("Timeouts", "[executor]") {
	SECTION("libcurl timeout") {
		HttpResponse response;
		response.error = "Operation timed out after 10001 milliseconds with 0 bytes received";
		auto outcome = CurlRequestExecutor::classify(response, CURLE_OPERATION_TIMEDOUT);
		REQUIRE(outcome.kind == Outcome::Timeout);
		REQUIRE(outcome.timeoutSeconds == 10);
	}

	SECTION("HTTP 408") {
		auto outcome = CurlRequestExecutor::classify(responseWith(408, ""), CURLE_OK, 5);
		REQUIRE(outcome.kind == Outcome::Timeout);
		REQUIRE(outcome.status == 408);
		REQUIRE(outcome.timeoutSeconds == 5);
	}
}

TEST_CASE("Transport failures", "[executor]") {
	SECTION("libcurl error text is kept") {
		HttpResponse response;
		response.error = "Failed to connect to primary.test port 443";
		auto outcome = CurlRequestExecutor::classify(response, CURLE_COULDNT_CONNECT);
		REQUIRE(outcome.kind == Outcome::TransportError);
		REQUIRE(outcome.message == "Failed to connect to primary.test port 443");
	}

	SECTION("falls back to the libcurl code description") {
		auto outcome = CurlRequestExecutor::classify(HttpResponse(), CURLE_COULDNT_RESOLVE_HOST);
		REQUIRE(outcome.kind == Outcome::TransportError);
		REQUIRE(outcome.message == curl_easy_strerror(CURLE_COULDNT_RESOLVE_HOST));
	}
}

TEST_CASE("Reason phrase is appended to the status", "[executor]") {
	HttpResponse response = responseWith(503, "");
	response.reason = "Service Unavailable";

	auto outcome = CurlRequestExecutor::classify(response, CURLE_OK);
	REQUIRE(outcome.kind == Outcome::ServerError);
	REQUIRE(outcome.message == "HTTP 503: Service Unavailable");
	REQUIRE(outcome.describe() == "Gateway error: HTTP 503: Service Unavailable");
}

TEST_CASE("Other non-2xx statuses are server errors", "[executor]") {
	for (long status : {500L, 502L, 503L, 404L, 301L}) {
		auto outcome = CurlRequestExecutor::classify(responseWith(status, R"({"success":true})"), CURLE_OK);
		INFO("status: " << status);
		REQUIRE(outcome.kind == Outcome::ServerError);
		REQUIRE(outcome.status == status);
		REQUIRE(outcome.message == "HTTP " + std::to_string(status));
		REQUIRE_FALSE(outcome.invalidPayload);
	}
}

TEST_CASE("Unreachable gateway yields a transport error", "[executor][curl]") {
	RequestPolicy policy = CurlRequestExecutor::defaultPolicy();
	policy.timeout = 5;
	CurlRequestExecutor executor(policy);

	GatewayRequest request;
	request.method = "resolve";
	request.params = {{"urls", nlohmann::json::array({"lbry://@test"})}};

	// Nothing listens on port 1
	auto outcome = executor.execute("http://127.0.0.1:1/api/v1/proxy", request);
	REQUIRE(outcome.kind == Outcome::TransportError);
	REQUIRE_FALSE(outcome.message.empty());
}

TEST_CASE("Gateway answers over a real connection", "[executor][curl]") {
	RequestPolicy policy = CurlRequestExecutor::defaultPolicy();
	policy.timeout = 5;
	CurlRequestExecutor executor(policy);

	GatewayRequest request;
	request.method = "resolve";
	request.params = {{"urls", nlohmann::json::array({"lbry://@test"})}};

	SECTION("successful envelope") {
		test::LoopbackServer server(test::httpResponse("200 OK", R"({"success":true,"data":{"n":1}})"));
		auto outcome = executor.execute(server.url(), request);

		REQUIRE(outcome.kind == Outcome::Success);
		REQUIRE((*outcome.response->data)["n"] == 1);

		auto bodies = server.bodies();
		REQUIRE(bodies.size() == 1);
		auto sent = nlohmann::json::parse(bodies[0]);
		REQUIRE(sent["method"] == "resolve");
		REQUIRE(sent["params"]["urls"][0] == "lbry://@test");
	}

	SECTION("status line reason phrase") {
		test::LoopbackServer server(test::httpResponse("503 Service Unavailable", ""));
		auto outcome = executor.execute(server.url(), request);

		REQUIRE(outcome.kind == Outcome::ServerError);
		REQUIRE(outcome.message == "HTTP 503: Service Unavailable");
	}

	SECTION("429 with Retry-After") {
		test::LoopbackServer server(test::httpResponse("429 Too Many Requests", "", "Retry-After: 17\r\n"));
		auto outcome = executor.execute(server.url(), request);

		REQUIRE(outcome.kind == Outcome::RateLimited);
		REQUIRE(outcome.retryAfterSeconds == 17);
	}

	SECTION("absurd Content-Length fails the attempt") {
		test::LoopbackServer server(
			"HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Length: 99999999999999999\r\n"
			"Connection: close\r\n\r\n{\"success\":true}");
		auto outcome = executor.execute(server.url(), request);

		REQUIRE(outcome.kind == Outcome::TransportError);
		REQUIRE_FALSE(outcome.message.empty());
	}

	SECTION("invalid UTF-8 in params is replaced") {
		test::LoopbackServer server(test::httpResponse("200 OK", R"({"success":true})"));
		request.params = {{"urls", nlohmann::json::array({"lbry://\xc3"})}};

		auto outcome = executor.execute(server.url(), request);
		REQUIRE(outcome.kind == Outcome::Success);

		auto bodies = server.bodies();
		REQUIRE(bodies.size() == 1);
		auto sent = nlohmann::json::parse(bodies[0]);
		REQUIRE(sent["params"]["urls"][0] == "lbry://\xef\xbf\xbd");
	}
}
