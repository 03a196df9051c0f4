#include "tsregress/utils/worker_pool.hpp"
#include <algorithm>
#include <stdexcept>
#include <thread>

namespace tsregress::utils {

WorkerPool::WorkerPool(int max_concurrency) : concurrency_(ResolveConcurrency(max_concurrency)) {
}

std::size_t WorkerPool::ResolveConcurrency(int requested) {
	if (requested == -1) {
		return std::max<std::size_t>(std::thread::hardware_concurrency(), 1);
	}
	if (requested < 1) {
		throw std::invalid_argument("WorkerPool: concurrency must be positive or -1.");
	}
	return static_cast<std::size_t>(requested);
}

void WorkerPool::submit(Task task) {
	if (!task) {
		throw std::invalid_argument("WorkerPool: cannot submit an empty task.");
	}
	tasks_.push_back(std::move(task));
}

void WorkerPool::joinBatch() {
	errors_.assign(tasks_.size(), nullptr);
	next_task_ = 0;

	const std::size_t n_threads = std::min(concurrency_, tasks_.size());
	if (n_threads <= 1) {
		runWorker();
	} else {
		std::vector<std::thread> threads;
		threads.reserve(n_threads);
		for (std::size_t i = 0; i < n_threads; ++i) {
			threads.emplace_back([this]() { runWorker(); });
		}
		for (auto &thread : threads) {
			thread.join();
		}
	}

	tasks_.clear();
	auto errors = std::move(errors_);
	errors_.clear();
	for (auto &error : errors) {
		if (error) {
			std::rethrow_exception(error);
		}
	}
}

void WorkerPool::runWorker() {
	while (true) {
		std::size_t index = 0;
		{
			std::lock_guard<std::mutex> lock(mutex_);
			if (next_task_ >= tasks_.size()) {
				return;
			}
			index = next_task_++;
		}
		try {
			tasks_[index]();
		} catch (...) {
			// Each slot is written by exactly one worker.
			errors_[index] = std::current_exception();
		}
	}
}

} // namespace tsregress::utils
