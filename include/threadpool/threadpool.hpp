#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <thread>
#include <vector>
#include <atomic>
#include <functional>
#include <stdexcept>
#include <type_traits>

namespace net = boost::asio;

/**
 * Worker pool for blocking work (directory round trips, SQLite).
 * Tasks already posted run to completion even if the submitter stops waiting.
 */
class ThreadPool
{
public:
    explicit ThreadPool(size_t n_threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    // Runs fn on a worker and resumes the awaiting coroutine on its own executor.
    template<class Fn>
    auto async_submit(Fn fn) -> net::awaitable<std::invoke_result_t<Fn>>
    {
        using Ret = std::invoke_result_t<Fn>;

        if (!running)
        {
            throw std::runtime_error("ThreadPool stopped");
        }

        co_return co_await net::co_spawn(
            pool_exec,
            [f = std::move(fn)]() mutable -> net::awaitable<Ret> { co_return std::invoke(f); },
            net::use_awaitable
        );
    }

    net::any_io_executor get_executor() const { return pool_exec; }
    size_t size() const { return workers.size(); }
    [[nodiscard]] bool is_running() const { return running.load(); }
    void stop();

private:
    net::io_context pool_ctx;
    net::executor_work_guard<net::io_context::executor_type> work_guard;
    std::vector<std::jthread> workers;
    std::atomic<bool> running{true};

    net::any_io_executor pool_exec{pool_ctx.get_executor()};
};

[[nodiscard]] size_t default_worker_count(size_t configured);
