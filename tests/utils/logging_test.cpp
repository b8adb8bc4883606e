#include <catch2/catch.hpp>

#include "finsight/utils/logging.hpp"

#ifndef FINSIGHT_NO_LOGGING

#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

using finsight::utils::Logging;

TEST_CASE("Logging hands every thread the same logger", "[utils][logging]") {
	constexpr std::size_t kThreads = 8;
	std::vector<std::shared_ptr<spdlog::logger>> seen(kThreads);
	std::vector<std::thread> threads;
	for (std::size_t i = 0; i < kThreads; ++i) {
		threads.emplace_back([&seen, i] {
			seen[i] = Logging::getLogger();
			FINSIGHT_TRACE("logger requested from thread {}", i);
		});
	}
	for (auto &thread : threads) {
		thread.join();
	}

	REQUIRE(seen[0] != nullptr);
	REQUIRE(seen[0]->name() == "finsight");
	for (const auto &logger : seen) {
		REQUIRE(logger.get() == seen[0].get());
	}
}

TEST_CASE("Logging init changes the shared level", "[utils][logging]") {
	const auto before = Logging::getLogger().get();
	Logging::init(spdlog::level::warn);
	REQUIRE(Logging::getLogger()->level() == spdlog::level::warn);
	REQUIRE(Logging::getLogger().get() == before);
	Logging::init(spdlog::level::info);
	REQUIRE(Logging::getLogger()->level() == spdlog::level::info);
}

#endif // FINSIGHT_NO_LOGGING
