#pragma once

#include <libumbra/basics/Errors.h>
#include <libumbra/basics/Journal.h>

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace umbra {
namespace zkp {

/**
 * Unit of work for ProverQueue.
 *
 * Exactly one of execute() or discard() is called for every job that was
 * added to a queue. A job cancelled before a worker reaches it is
 * discarded without running.
 */
class ProverJob
{
public:
    virtual ~ProverJob() = default;

    void cancel() noexcept
    {
        cancelled_ = true;
    }

    bool isCancelled() const noexcept
    {
        return cancelled_.load();
    }

    virtual void execute() = 0;
    virtual void discard() = 0;

private:
    std::atomic<bool> cancelled_{false};
};

/** A job whose result or exception is delivered through a future. */
template <class T>
class ProverTask : public ProverJob
{
public:
    explicit ProverTask(std::function<T()> work) : work_(std::move(work))
    {
    }

    std::future<T> getFuture()
    {
        return promise_.get_future();
    }

    void execute() override
    {
        try
        {
            promise_.set_value(work_());
        }
        catch (...)
        {
            // Delivered to whoever waits on the future.
            promise_.set_exception(std::current_exception());
        }
    }

    void discard() override
    {
        promise_.set_exception(std::make_exception_ptr(
            TimeoutError("job cancelled before it started")));
    }

private:
    std::function<T()> work_;
    std::promise<T> promise_;
};

/**
 * Fixed pool of worker threads draining a FIFO of jobs.
 *
 * The worker count bounds CPU use by proving; callers never run proofs on
 * threads of their own.
 */
class ProverQueue
{
public:
    ProverQueue(std::size_t workers, Journal j);
    ~ProverQueue();

    ProverQueue(ProverQueue const&) = delete;
    ProverQueue& operator=(ProverQueue const&) = delete;

    /** Throws StateInvariantError once the queue is closed. */
    void add(std::shared_ptr<ProverJob> job);

    std::size_t workers() const
    {
        return workers_.size();
    }

    std::size_t pending() const;

    /** Stops accepting work, discards queued jobs, joins the workers. */
    void close();

    /** Stops accepting work, runs what is queued, joins the workers. */
    void finish();

private:
    void run(std::size_t id);
    void join();

    Journal j_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    bool closed_ = false;
    bool finishing_ = false;
    std::queue<std::shared_ptr<ProverJob>> jobs_;
    std::vector<std::thread> workers_;
};

}  // namespace zkp
}  // namespace umbra
