#pragma once

#include "stockcast/core/outcome.hpp"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <thread>
#include <utility>
#include <vector>

namespace stockcast::utils {

struct ParallelOptions {
	/// Upper bound on worker threads; 0 uses the hardware concurrency.
	std::size_t max_parallelism = 0;
};

/**
 * @class ThreadGroup
 * @brief Owns worker threads and joins them on destruction.
 *
 * If spawning fails part way, the threads already started still finish
 * before the exception leaves the scope.
 */
class ThreadGroup {
public:
	ThreadGroup() = default;
	ThreadGroup(const ThreadGroup &) = delete;
	ThreadGroup &operator=(const ThreadGroup &) = delete;

	~ThreadGroup() {
		join();
	}

	template <typename Fn>
	void spawn(Fn &&fn) {
		threads_.emplace_back(std::forward<Fn>(fn));
	}

	void join() {
		for (auto &thread : threads_) {
			if (thread.joinable()) {
				thread.join();
			}
		}
		threads_.clear();
	}

	std::size_t size() const {
		return threads_.size();
	}

private:
	std::vector<std::thread> threads_;
};

/**
 * @brief Runs @p task(i) for i in [0, count) on a bounded set of worker threads.
 *
 * Each index owns one pre-sized result slot. An exception thrown by one task
 * is recorded in that task's slot and never affects the others. Returns once
 * every worker has joined.
 */
template <typename T, typename Task>
std::vector<core::Outcome<T>> runIsolated(std::size_t count, Task task, const ParallelOptions &options = {}) {
	std::vector<core::Outcome<T>> results(count);
	if (count == 0) {
		return results;
	}

	std::size_t workers = options.max_parallelism;
	if (workers == 0) {
		workers = std::max<std::size_t>(1, std::thread::hardware_concurrency());
	}
	workers = std::min(workers, count);

	std::atomic<std::size_t> next{0};
	auto worker = [&]() {
		for (std::size_t index = next.fetch_add(1); index < count; index = next.fetch_add(1)) {
			try {
				results[index] = core::Outcome<T>::success(task(index));
			} catch (const std::exception &e) {
				results[index] = core::Outcome<T>::failure(core::classifyError(e), e.what());
			} catch (...) {
				results[index] = core::Outcome<T>::failure(core::ErrorKind::Other, "unknown error");
			}
		}
	};

	if (workers == 1) {
		worker();
		return results;
	}

	// Declared after everything the workers touch, so unwinding joins them first.
	ThreadGroup group;
	for (std::size_t i = 0; i < workers; ++i) {
		group.spawn(worker);
	}
	group.join();
	return results;
}

} // namespace stockcast::utils
