#include <catch2/catch.hpp>

#include "RetryStrategies.hpp"

#include <chrono>
#include <cstdint>
#include <set>

using namespace gateway_failover;

namespace {

RetryContext contextWith(Outcome::Kind kind) {
	RetryContext ctx;
	AttemptRecord record;
	record.kind = kind;
	ctx.attempts.push_back(record);
	return ctx;
}

} // namespace

TEST_CASE("Schedule constants", "[schedule]") {
	STATIC_REQUIRE(schedule::retryBaseDelay(0) == 200);
	STATIC_REQUIRE(schedule::retryBaseDelay(1) == 500);
	STATIC_REQUIRE(schedule::retryBaseDelay(2) == 1000);
	STATIC_REQUIRE(schedule::retryBaseDelay(7) == 1000);
	STATIC_REQUIRE(schedule::RETRY_JITTER_MS == 50);

	STATIC_REQUIRE(schedule::failoverBaseDelay(0) == 300);
	STATIC_REQUIRE(schedule::failoverBaseDelay(1) == 1000);
	STATIC_REQUIRE(schedule::failoverBaseDelay(2) == 2000);
	STATIC_REQUIRE(schedule::failoverBaseDelay(9) == 2000);
	STATIC_REQUIRE(schedule::FAILOVER_JITTER_MS == 100);
}

TEST_CASE("Retry backoff stays within base + [0, 50) ms", "[schedule]") {
	auto backoff = retry::retryBackoff();

	for (uint32_t index : {0u, 1u, 2u, 3u, 10u}) {
		const auto base = static_cast<int64_t>(schedule::retryBaseDelay(index));
		for (int i = 0; i < 200; ++i) {
			auto delay = backoff(index).count();
			REQUIRE(delay >= base);
			REQUIRE(delay < base + 50);
		}
	}
}

TEST_CASE("Failover backoff stays within base + [0, 100) ms", "[schedule]") {
	auto backoff = retry::failoverBackoff();

	for (uint32_t index : {0u, 1u, 2u, 5u}) {
		const auto base = static_cast<int64_t>(schedule::failoverBaseDelay(index));
		for (int i = 0; i < 200; ++i) {
			auto delay = backoff(index).count();
			REQUIRE(delay >= base);
			REQUIRE(delay < base + 100);
		}
	}
}

TEST_CASE("Jitter generator is bounded and varies", "[schedule]") {
	REQUIRE(util::jitter_generator(0) == 0);
	REQUIRE(util::jitter_generator(1) == 0);

	std::set<uint64_t> seen;
	for (int i = 0; i < 2000; ++i) {
		uint64_t jitter = util::jitter_generator(100);
		REQUIRE(jitter < 100);
		seen.insert(jitter);
	}
	// 2000 uniform draws over 100 values leave essentially no value unseen
	REQUIRE(seen.size() > 50);
}

TEST_CASE("Stepped backoff repeats its last step", "[schedule]") {
	auto backoff = retry::steppedBackoff({10, 20}, 0);
	REQUIRE(backoff(0) == std::chrono::milliseconds(10));
	REQUIRE(backoff(1) == std::chrono::milliseconds(20));
	REQUIRE(backoff(4) == std::chrono::milliseconds(20));

	auto empty = retry::steppedBackoff({}, 0);
	REQUIRE(empty(3) == std::chrono::milliseconds(0));
}

TEST_CASE("Default retry condition", "[retry]") {
	auto shouldRetry = retry::defaultCondition();

	REQUIRE(shouldRetry(contextWith(Outcome::Timeout)));
	REQUIRE(shouldRetry(contextWith(Outcome::TransportError)));
	REQUIRE(shouldRetry(contextWith(Outcome::ServerError)));
	REQUIRE_FALSE(shouldRetry(contextWith(Outcome::RateLimited)));
	REQUIRE_FALSE(shouldRetry(contextWith(Outcome::Success)));
	REQUIRE_FALSE(shouldRetry(RetryContext()));
}

TEST_CASE("Retry context bookkeeping", "[retry]") {
	RetryContext ctx;
	REQUIRE(ctx.attemptCount() == 0);
	REQUIRE(ctx.lastAttempt() == nullptr);

	ctx.attempts.push_back(AttemptRecord{0, 0, Outcome::Timeout, 12, 0});
	ctx.attempts.push_back(AttemptRecord{0, 1, Outcome::ServerError, 8, 0});
	ctx.attempts.push_back(AttemptRecord{1, 0, Outcome::Success, 30, 0});

	REQUIRE(ctx.attemptCount() == 3);
	REQUIRE(ctx.attemptsOn(0) == 2);
	REQUIRE(ctx.attemptsOn(1) == 1);
	REQUIRE(ctx.attemptsOn(2) == 0);
	REQUIRE(ctx.lastAttempt()->kind == Outcome::Success);
}

TEST_CASE("Default retry policy wires the fixed schedules", "[retry]") {
	RetryPolicy policy;
	REQUIRE(policy.shouldRetry);
	REQUIRE(policy.retryDelay);
	REQUIRE(policy.failoverDelay);

	auto retryDelay = policy.retryDelay(0).count();
	REQUIRE(retryDelay >= 200);
	REQUIRE(retryDelay < 250);

	auto failoverDelay = policy.failoverDelay(1).count();
	REQUIRE(failoverDelay >= 1000);
	REQUIRE(failoverDelay < 1100);
}
