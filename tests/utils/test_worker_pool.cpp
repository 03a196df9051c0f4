#include <catch2/catch.hpp>

#include "tsregress/utils/worker_pool.hpp"

#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using tsregress::utils::WorkerPool;

TEST_CASE("WorkerPool fills every result slot", "[utils][pool]") {
	WorkerPool pool(4);
	REQUIRE(pool.concurrency() == 4);

	std::vector<int> results(25, 0);
	for (std::size_t i = 0; i < results.size(); ++i) {
		pool.submit([&results, i]() { results[i] = static_cast<int>(i * i); });
	}
	REQUIRE(pool.pending() == 25);
	pool.joinBatch();
	REQUIRE(pool.pending() == 0);

	for (std::size_t i = 0; i < results.size(); ++i) {
		REQUIRE(results[i] == static_cast<int>(i * i));
	}

	// The pool is reusable once a batch has been joined.
	std::atomic<int> counter {0};
	for (int i = 0; i < 3; ++i) {
		pool.submit([&counter]() { ++counter; });
	}
	pool.joinBatch();
	REQUIRE(counter.load() == 3);
}

TEST_CASE("WorkerPool runs inline with a concurrency of one", "[utils][pool]") {
	WorkerPool pool;
	const auto caller = std::this_thread::get_id();
	std::vector<std::thread::id> seen;
	for (int i = 0; i < 3; ++i) {
		pool.submit([&seen]() { seen.push_back(std::this_thread::get_id()); });
	}
	pool.joinBatch();
	REQUIRE(seen == std::vector<std::thread::id>(3, caller));
}

TEST_CASE("WorkerPool rethrows the earliest failure after the batch", "[utils][pool][error]") {
	WorkerPool pool(3);
	std::atomic<int> completed {0};
	for (int i = 0; i < 8; ++i) {
		pool.submit([&completed, i]() {
			if (i == 2 || i == 5) {
				throw std::runtime_error("task " + std::to_string(i));
			}
			++completed;
		});
	}

	try {
		pool.joinBatch();
		FAIL("joinBatch should rethrow");
	} catch (const std::runtime_error &e) {
		REQUIRE(std::string(e.what()) == "task 2");
	}
	REQUIRE(completed.load() == 6);
	REQUIRE(pool.pending() == 0);
}

TEST_CASE("WorkerPool validates its arguments", "[utils][pool][error]") {
	REQUIRE(WorkerPool::ResolveConcurrency(-1) >= 1);
	REQUIRE(WorkerPool::ResolveConcurrency(6) == 6);
	REQUIRE_THROWS_AS(WorkerPool::ResolveConcurrency(0), std::invalid_argument);
	REQUIRE_THROWS_AS(WorkerPool(-2), std::invalid_argument);

	WorkerPool pool;
	REQUIRE_THROWS_AS(pool.submit(WorkerPool::Task()), std::invalid_argument);
	pool.joinBatch();
}
