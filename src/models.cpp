#include "models.hpp"

#include <stdexcept>

namespace gateway_failover {

namespace {

template <typename T>
void put_optional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
	if (value)
		j[key] = *value;
	else
		j[key] = nullptr;
}

template <typename T>
std::optional<T> get_optional(const nlohmann::json& j, const char* key) {
	auto it = j.find(key);
	if (it == j.end() || it->is_null())
		return std::nullopt;
	return it->get<T>();
}

} // namespace

std::string_view to_string(HealthStatus status) {
	switch (status) {
		case HealthStatus::Healthy:
			return "healthy";
		case HealthStatus::Unhealthy:
			return "unhealthy";
		default:
			return "unknown";
	}
}

HealthStatus health_status_from_string(std::string_view name) {
	if (name == "healthy")
		return HealthStatus::Healthy;
	if (name == "unhealthy")
		return HealthStatus::Unhealthy;
	if (name == "unknown")
		return HealthStatus::Unknown;
	throw std::invalid_argument("Unknown gateway health status: " + std::string(name));
}

void to_json(nlohmann::json& j, const GatewayRequest& request) {
	j = nlohmann::json{{"method", request.method}, {"params", request.params}};
}

void from_json(const nlohmann::json& j, GatewayRequest& request) {
	j.at("method").get_to(request.method);
	request.params = j.value("params", nlohmann::json::object());
}

void to_json(nlohmann::json& j, const GatewayResponse& response) {
	j = nlohmann::json{{"success", response.success}};
	put_optional(j, "error", response.error);
	put_optional(j, "data", response.data);
}

void from_json(const nlohmann::json& j, GatewayResponse& response) {
	// at() + get<bool>() reject a missing or non-boolean flag
	response.success = j.at("success").get<bool>();
	response.error = get_optional<std::string>(j, "error");
	response.data = get_optional<nlohmann::json>(j, "data");
}

void to_json(nlohmann::json& j, const GatewayHealth& health) {
	j = nlohmann::json{{"url", health.url}, {"status", std::string(to_string(health.status))}};
	put_optional(j, "last_success", health.last_success);
	put_optional(j, "last_error", health.last_error);
	put_optional(j, "response_time_ms", health.response_time_ms);
}

void from_json(const nlohmann::json& j, GatewayHealth& health) {
	j.at("url").get_to(health.url);
	health.status = health_status_from_string(j.at("status").get<std::string>());
	health.last_success = get_optional<int64_t>(j, "last_success");
	health.last_error = get_optional<std::string>(j, "last_error");
	health.response_time_ms = get_optional<uint64_t>(j, "response_time_ms");
}

} // namespace gateway_failover
