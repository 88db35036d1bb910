#include "GatewayClient.hpp"

#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

using namespace gateway_failover;

void printResponse(const GatewayResponse& response) {
	std::cout << "Success: " << std::boolalpha << response.success << std::endl;
	if (response.error)
		std::cout << "Error: " << *response.error << std::endl;
	if (response.data) {
		std::string body = response.data->dump(2);
		if (body.size() > 2000)
			body = body.substr(0, 2000) + "\n...";
		std::cout << "Data: " << std::endl << body << std::endl;
	}
}

void printHealth(const GatewayClient& client) {
	std::cout << "Gateway health:" << std::endl;
	for (const auto& health : client.get_health_stats()) {
		std::cout << "  " << health.url << " -> " << to_string(health.status);
		if (health.response_time_ms)
			std::cout << " (" << *health.response_time_ms << "ms)";
		if (health.last_error)
			std::cout << " last error: " << *health.last_error;
		std::cout << std::endl;
	}
}

void testClaimSearch(GatewayClient& client) {
	std::cout << "claim_search request..." << std::endl;

	GatewayRequest request;
	request.method = "claim_search";
	request.params = {{"channel", "@odysee"}, {"page_size", 5}, {"order_by", nlohmann::json::array({"release_time"})}};

	try {
		printResponse(client.fetch_with_failover(request));
	} catch (const GatewayError& e) {
		std::cerr << "Request failed: " << e.what() << std::endl;
		std::cerr << "User message: " << e.userMessage() << std::endl;
	}
}

void testResolveWithDeadline(GatewayClient& client) {
	std::cout << "resolve request with a 30s caller deadline..." << std::endl;

	GatewayRequest request;
	request.method = "resolve";
	request.params = {{"urls", nlohmann::json::array({"lbry://@odysee"})}};

	auto future = client.fetch_async(request);
	if (future.wait_for(std::chrono::seconds(30)) != std::future_status::ready) {
		// The call keeps running in the background; the future's destructor waits for it
		std::cerr << "Deadline exceeded, abandoning the result" << std::endl;
		return;
	}

	try {
		printResponse(future.get());
	} catch (const GatewayError& e) {
		std::cerr << "Request failed: " << e.what() << std::endl;
	}
}

int main() {
	std::cout << "========================================" << std::endl;
	std::cout << "   GatewayClient Example" << std::endl;
	std::cout << "========================================" << std::endl << std::endl;

	std::cout << "Note: These examples require an internet connection" << std::endl;
	std::cout << "      to reach the configured gateways" << std::endl << std::endl;

	try {
		GatewayClientSettings settings;
		settings.gatewayLog = std::make_shared<GatewayLog>();

		GatewayClient client(GatewayConfig::getDefault(), nullptr, std::move(settings));

		std::cout << "Priority order:" << std::endl;
		for (const auto& url : client.priority_order())
			std::cout << "  " << url << std::endl;
		std::cout << "Current gateway: " << client.current_gateway() << std::endl;

		std::cout << "\n[1] claim_search" << std::endl;
		std::cout << "----------------------------------------" << std::endl;
		testClaimSearch(client);

		std::cout << "\n[2] resolve (async)" << std::endl;
		std::cout << "----------------------------------------" << std::endl;
		testResolveWithDeadline(client);

		std::cout << std::endl;
		printHealth(client);

		client.write_diagnostics();
		std::cout << "\nDiagnostics appended to " << GatewayLog::DEFAULT_PATH << std::endl;

		return 0;
	} catch (const std::exception& e) {
		std::cerr << "Failed with exception: " << e.what() << std::endl;
		return 1;
	}
}
