#include <libumbra/zkp/ProverQueue.h>

namespace umbra {
namespace zkp {

ProverQueue::ProverQueue(std::size_t workers, Journal j) : j_(j)
{
    if (workers == 0)
        throw InputValidationError("prover queue needs at least one worker");

    workers_.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i)
        workers_.emplace_back([this, i] { run(i); });

    JLOG(j_.debug()) << "prover queue started with " << workers << " workers";
}

ProverQueue::~ProverQueue()
{
    close();
}

void
ProverQueue::add(std::shared_ptr<ProverJob> job)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || finishing_)
            throw StateInvariantError("prover queue is closed");
        jobs_.push(std::move(job));
    }
    condition_.notify_one();
}

std::size_t
ProverQueue::pending() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

void
ProverQueue::run(std::size_t id)
{
    for (;;)
    {
        std::shared_ptr<ProverJob> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            condition_.wait(lock, [this] {
                return closed_ || finishing_ || !jobs_.empty();
            });

            if (closed_ || jobs_.empty())
                break;

            job = std::move(jobs_.front());
            jobs_.pop();
        }

        if (job->isCancelled())
        {
            JLOG(j_.trace()) << "worker " << id << " skipping cancelled job";
            job->discard();
        }
        else
        {
            job->execute();
        }
    }
}

void
ProverQueue::join()
{
    condition_.notify_all();
    for (auto& t : workers_)
        if (t.joinable())
            t.join();
}

void
ProverQueue::close()
{
    std::queue<std::shared_ptr<ProverJob>> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        dropped.swap(jobs_);
    }
    join();

    while (!dropped.empty())
    {
        dropped.front()->discard();
        dropped.pop();
    }
}

void
ProverQueue::finish()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finishing_ = true;
    }
    join();
}

}  // namespace zkp
}  // namespace umbra
