#include "threadpool/threadpool.hpp"

ThreadPool::ThreadPool(size_t n_threads)
    : work_guard(net::make_work_guard(pool_ctx))
    , workers(n_threads == 0 ? 1 : n_threads)
{
    for (auto& t : workers)
    {
        t = std::jthread([this] {pool_ctx.run();});
    }
}

ThreadPool::~ThreadPool()
{
    stop();
}

// Queued tasks are drained before the workers exit, so an in-flight bind always reaches its unbind.
void ThreadPool::stop()
{
    if (bool was_running = running.exchange(false); !was_running)
    {
        return;
    }

    work_guard.reset();

    for (auto& t : workers)
    {
        if (t.joinable())
        {
            t.join();
        }
    }
}

size_t default_worker_count(size_t configured)
{
    if (configured != 0)
    {
        return configured;
    }

    size_t hw = std::thread::hardware_concurrency();
    if (hw <= 2)
    {
        return 2;
    }
    return hw;
}
