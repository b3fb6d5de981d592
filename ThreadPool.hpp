// File: ThreadPool.hpp
// Description: Fixed set of worker threads for blocking work (database
// round trips, password hashing). Sessions enqueue a job and post the answer
// back to their own strand when it is done.
#pragma once

#include <condition_variable>
#include <functional>
#include <iostream>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

class ThreadPool
{
	std::vector<std::thread> workers_;
	std::queue<std::function<void()>> tasks_;
	std::mutex queue_mutex_;
	std::condition_variable condition_;
	bool stop_ = false;

public:
	explicit ThreadPool(std::size_t threads)
	{
		if (threads == 0)
			threads = 1;
		workers_.reserve(threads);
		for (std::size_t i = 0; i < threads; ++i)
		{
			workers_.emplace_back([this]
				{
					for (;;)
					{
						std::function<void()> task;
						{
							std::unique_lock<std::mutex> lock(queue_mutex_);
							condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
							if (stop_ && tasks_.empty())
								return;
							task = std::move(tasks_.front());
							tasks_.pop();
						}

						try {
							task();
						}
						catch (const std::exception& e) {
							// Jobs report their own errors; this only keeps the worker alive
							std::cerr << "[ThreadPool] Task threw: " << e.what() << std::endl;
						}
					}
				});
		}
	}

	~ThreadPool()
	{
		shutdown();
	}

	/**
	 * @brief Runs what is already queued, then joins the workers.
	 * Safe to call more than once.
	 */
	void shutdown()
	{
		{
			std::lock_guard<std::mutex> lock(queue_mutex_);
			stop_ = true;
		}
		condition_.notify_all();
		for (auto& worker : workers_)
			if (worker.joinable() && worker.get_id() != std::this_thread::get_id())
				worker.join();
	}

	ThreadPool(const ThreadPool&) = delete;
	ThreadPool& operator=(const ThreadPool&) = delete;

	/**
	 * @brief Queues a job. Jobs queued before shutdown still run.
	 */
	void enqueue(std::function<void()> task)
	{
		{
			std::lock_guard<std::mutex> lock(queue_mutex_);
			if (stop_)
				throw std::runtime_error("enqueue on a stopped ThreadPool");
			tasks_.push(std::move(task));
		}
		condition_.notify_one();
	}

	std::size_t size() const { return workers_.size(); }
};
