#include <catch2/catch.hpp>

#include "finsight/service/result_cache.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

using finsight::service::ResultCache;

namespace {

/// A clock the test advances by hand.
struct FakeClock {
	ResultCache<int>::TimePoint now{};

	ResultCache<int>::NowFn fn() {
		return [this] { return now; };
	}

	void advance(std::chrono::seconds by) {
		now += by;
	}
};

} // namespace

TEST_CASE("ResultCache builds user-scoped keys", "[service][cache]") {
	REQUIRE(ResultCache<int>::key("alice", "forecast", "daily:7") == "alice:forecast:daily:7");
	REQUIRE(ResultCache<int>::key("", "budget", "") == "::");
	REQUIRE(ResultCache<int>::key("a:b", "forecast", "x") == "a%3Ab:forecast:x");
	REQUIRE(ResultCache<int>::key("50%", "budget", "") == "50%25:budget:");
}

TEST_CASE("ResultCache expires entries after the TTL", "[service][cache]") {
	FakeClock clock;
	ResultCache<int> cache(std::chrono::seconds(900), clock.fn());
	cache.put("alice:forecast:x", 42);

	clock.advance(std::chrono::seconds(899));
	REQUIRE(cache.get("alice:forecast:x") == 42);

	clock.advance(std::chrono::seconds(1));
	REQUIRE_FALSE(cache.get("alice:forecast:x").has_value());
	REQUIRE(cache.size() == 0);
	REQUIRE(cache.hits() == 1);
	REQUIRE(cache.misses() == 1);
}

TEST_CASE("ResultCache with a zero TTL never serves a value", "[service][cache]") {
	FakeClock clock;
	ResultCache<int> cache(std::chrono::seconds(0), clock.fn());
	cache.put("k", 1);
	REQUIRE_FALSE(cache.get("k").has_value());
}

TEST_CASE("ResultCache getOrCompute computes once per live entry", "[service][cache]") {
	FakeClock clock;
	ResultCache<std::string> cache(std::chrono::seconds(60), [&clock] { return clock.now; });
	int calls = 0;
	auto compute = [&calls] {
		++calls;
		return std::string("value ") + std::to_string(calls);
	};

	REQUIRE(cache.getOrCompute("bob:patterns:90", compute) == "value 1");
	REQUIRE(cache.getOrCompute("bob:patterns:90", compute) == "value 1");
	REQUIRE(calls == 1);
	REQUIRE(cache.hits() == 1);
	REQUIRE(cache.misses() == 1);

	clock.advance(std::chrono::seconds(60));
	REQUIRE(cache.getOrCompute("bob:patterns:90", compute) == "value 2");
	REQUIRE(calls == 2);
}

TEST_CASE("ResultCache does not store a failed computation", "[service][cache]") {
	ResultCache<int> cache;
	REQUIRE_THROWS_AS(cache.getOrCompute("k", []() -> int { throw std::runtime_error("boom"); }), std::runtime_error);
	REQUIRE(cache.size() == 0);
	REQUIRE(cache.getOrCompute("k", [] { return 3; }) == 3);
}

TEST_CASE("ResultCache invalidates one user's entries", "[service][cache]") {
	ResultCache<int> cache;
	cache.put("alice:forecast:daily:7", 1);
	cache.put("alice:budget:monthly", 2);
	cache.put("alicia:forecast:daily:7", 3);
	cache.put("bob:forecast:daily:7", 4);

	REQUIRE(cache.invalidateUser("alice") == 2);
	REQUIRE_FALSE(cache.get("alice:budget:monthly").has_value());
	REQUIRE(cache.get("alicia:forecast:daily:7") == 3);
	REQUIRE(cache.invalidateUser("carol") == 0);

	cache.clear();
	REQUIRE(cache.size() == 0);
}

TEST_CASE("ResultCache keeps users whose ids contain separators apart", "[service][cache]") {
	using Cache = ResultCache<int>;
	Cache cache;
	cache.put(Cache::key("team", "forecast", "daily:7"), 1);
	cache.put(Cache::key("team:alpha", "forecast", "daily:7"), 2);
	cache.put(Cache::key("team%3Aalpha", "forecast", "daily:7"), 3);

	REQUIRE(cache.invalidateUser("team") == 1);
	REQUIRE(cache.get(Cache::key("team:alpha", "forecast", "daily:7")) == 2);
	REQUIRE(cache.invalidateUser("team:alpha") == 1);
	REQUIRE(cache.get(Cache::key("team%3Aalpha", "forecast", "daily:7")) == 3);
	REQUIRE(cache.size() == 1);
}

TEST_CASE("ResultCache rejects a negative TTL", "[service][cache]") {
	REQUIRE_THROWS_AS(ResultCache<int>(std::chrono::seconds(-1)), std::invalid_argument);
	REQUIRE(ResultCache<int>().ttl() == std::chrono::seconds(900));
}
