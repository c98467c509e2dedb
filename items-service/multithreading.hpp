#pragma once

#include <spdlog/spdlog.h>

#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <utility>
#include <vector>

namespace items_service
{

enum class pop_result_t
{
	extracted,
	queue_closed
};

// Multi-producer/multi-consumer queue for objects of type T.
//
// Items pushed after close() are dropped. Once the queue is closed
// pop() returns pop_result_t::queue_closed even if there are items
// left.
template<typename T>
class message_queue_t
{
	std::mutex m_lock;
	std::condition_variable m_not_empty;

	std::queue<T> m_queue;

	bool m_closed{false};

public:
	// Returns false if the queue is already closed.
	bool push(T what)
	{
		std::lock_guard<std::mutex> lock{m_lock};
		if(m_closed)
			return false;

		const bool was_empty = m_queue.empty();
		m_queue.push(std::move(what));
		if(was_empty)
			m_not_empty.notify_one();

		return true;
	}

	pop_result_t pop(T & receiver)
	{
		std::unique_lock<std::mutex> lock{m_lock};
		m_not_empty.wait(lock,
				[&]{ return m_closed || !m_queue.empty(); });

		if(m_closed)
			return pop_result_t::queue_closed;

		receiver = std::move(m_queue.front());
		m_queue.pop();
		return pop_result_t::extracted;
	}

	void close() noexcept
	{
		std::lock_guard<std::mutex> lock{m_lock};
		if(!m_closed)
		{
			m_closed = true;
			m_not_empty.notify_all();
		}
	}
};

// Type of message for pushing tasks to a pool of worker threads.
struct task_t
{
	std::function<void()> m_task;

	task_t() = default;

	template<typename F>
	task_t(F && task) : m_task{std::forward<F>(task)} {}
};

// Fixed-size pool of worker threads fed from its own task queue.
//
// Threads are started in the constructor and work until stop() is
// called. Tasks that are still in the queue at stop() are dropped.
// An exception from a task is logged and doesn't stop the worker.
class worker_pool_t
{
	message_queue_t<task_t> m_queue;

	std::vector<std::thread> m_workers;

	void worker_loop()
	{
		for(;;)
		{
			task_t msg;
			if(pop_result_t::queue_closed == m_queue.pop(msg))
				break;

			try
			{
				msg.m_task();
			}
			catch(const std::exception & x)
			{
				spdlog::error("exception from a worker task: {}", x.what());
			}
		}
	}

public:
	worker_pool_t(const worker_pool_t &) = delete;
	worker_pool_t & operator=(const worker_pool_t &) = delete;

	explicit worker_pool_t(std::size_t thread_count)
	{
		// Threads that were started before an exception must be stopped.
		try
		{
			m_workers.reserve(thread_count);
			for(std::size_t i = 0u; i != thread_count; ++i)
				m_workers.emplace_back([this] { worker_loop(); });
		}
		catch(...)
		{
			stop();
			throw;
		}
	}

	~worker_pool_t() noexcept
	{
		stop();
	}

	std::size_t size() const noexcept { return m_workers.size(); }

	// Returns false if the pool is stopped and the task won't be run.
	bool submit(task_t task)
	{
		return m_queue.push(std::move(task));
	}

	void stop() noexcept
	{
		m_queue.close();
		for(auto & w : m_workers)
		{
			if(w.joinable())
				w.join();
		}
		m_workers.clear();
	}
};

} /* namespace items_service */
