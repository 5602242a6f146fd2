#include <catch2/catch_test_macros.hpp>

#include "stockcast/core/errors.hpp"
#include "stockcast/utils/parallel.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

using stockcast::core::ErrorKind;
using stockcast::utils::ParallelOptions;
using stockcast::utils::runIsolated;

TEST_CASE("runIsolated fills one slot per index", "[utils][parallel]") {
	ParallelOptions options;
	options.max_parallelism = 4;
	const auto results = runIsolated<int>(50, [](std::size_t i) { return static_cast<int>(i * i); }, options);

	REQUIRE(results.size() == 50);
	for (std::size_t i = 0; i < results.size(); ++i) {
		REQUIRE(results[i].ok());
		REQUIRE(*results[i].value == static_cast<int>(i * i));
	}
}

TEST_CASE("runIsolated records failures without touching other slots", "[utils][parallel]") {
	const auto results = runIsolated<int>(6, [](std::size_t i) -> int {
		if (i == 2) {
			throw stockcast::core::UnsupportedModel("nope");
		}
		if (i == 4) {
			throw std::runtime_error("boom");
		}
		return static_cast<int>(i);
	});

	REQUIRE(results[0].ok());
	REQUIRE(results[5].ok());
	REQUIRE_FALSE(results[2].ok());
	REQUIRE(results[2].error->kind == ErrorKind::UnsupportedModel);
	REQUIRE(results[4].error->kind == ErrorKind::Other);
	REQUIRE(results[4].error->message == "boom");
}

TEST_CASE("runIsolated handles empty work", "[utils][parallel]") {
	REQUIRE(runIsolated<int>(0, [](std::size_t) { return 1; }).empty());
}

TEST_CASE("ThreadGroup joins started workers while unwinding", "[utils][parallel]") {
	std::atomic<int> finished {0};
	try {
		stockcast::utils::ThreadGroup group;
		for (int i = 0; i < 3; ++i) {
			group.spawn([&finished]() {
				std::this_thread::sleep_for(std::chrono::milliseconds(20));
				finished.fetch_add(1);
			});
		}
		REQUIRE(group.size() == 3);
		throw std::runtime_error("spawn failed");
	} catch (const std::runtime_error &e) {
		REQUIRE(std::string(e.what()) == "spawn failed");
	}
	REQUIRE(finished.load() == 3);
}

TEST_CASE("ThreadGroup join is idempotent", "[utils][parallel]") {
	std::atomic<int> counter {0};
	stockcast::utils::ThreadGroup group;
	group.spawn([&counter]() { counter.fetch_add(1); });
	group.join();
	REQUIRE(group.size() == 0);
	REQUIRE_NOTHROW(group.join());
	REQUIRE(counter.load() == 1);
}
