#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <vector>

namespace tsregress::utils {

/**
 * @class WorkerPool
 * @brief Runs batches of independent tasks on a bounded number of threads.
 *
 * Tasks are queued with submit() and executed by joinBatch(), which blocks
 * until every queued task has finished. With a concurrency of one the tasks
 * run inline on the calling thread. An exception thrown by a task does not
 * stop the others; once the batch is joined the exception of the earliest
 * submitted failing task is rethrown.
 */
class WorkerPool {
public:
	using Task = std::function<void()>;

	/// @param max_concurrency Upper bound on threads; -1 uses every hardware thread.
	explicit WorkerPool(int max_concurrency = 1);

	WorkerPool(const WorkerPool &) = delete;
	WorkerPool &operator=(const WorkerPool &) = delete;

	std::size_t concurrency() const noexcept {
		return concurrency_;
	}

	/// Not thread safe: submit every task of a batch before joining it.
	void submit(Task task);

	std::size_t pending() const noexcept {
		return tasks_.size();
	}

	/// Blocking call; rethrows the first task failure in submission order.
	void joinBatch();

	/// Resolves -1 to the hardware thread count; other values below 1 are rejected.
	static std::size_t ResolveConcurrency(int requested);

private:
	void runWorker();

	std::size_t concurrency_;
	std::vector<Task> tasks_;
	std::vector<std::exception_ptr> errors_;
	std::size_t next_task_ = 0;
	std::mutex mutex_;
};

} // namespace tsregress::utils
