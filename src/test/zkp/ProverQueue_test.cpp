#include <libumbra/zkp/ProverQueue.h>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>

namespace umbra {
namespace zkp {
namespace {

using namespace std::chrono_literals;

class ProverQueueTest : public ::testing::Test
{
protected:
    Journal j_{Journal::nullSink()};
};

TEST_F(ProverQueueTest, RunsJobsAndDeliversResults)
{
    ProverQueue queue(2, j_);
    EXPECT_EQ(queue.workers(), 2u);

    std::vector<std::future<int>> results;
    for (int i = 0; i < 8; ++i)
    {
        auto task = std::make_shared<ProverTask<int>>([i] { return i * i; });
        results.push_back(task->getFuture());
        queue.add(task);
    }
    for (int i = 0; i < 8; ++i)
        EXPECT_EQ(results[i].get(), i * i);
}

TEST_F(ProverQueueTest, DeliversExceptions)
{
    ProverQueue queue(1, j_);
    auto task = std::make_shared<ProverTask<int>>(
        []() -> int { throw WitnessGenerationError("unsatisfied"); });
    auto result = task->getFuture();
    queue.add(task);
    EXPECT_THROW(result.get(), WitnessGenerationError);
}

TEST_F(ProverQueueTest, CancelledJobIsDiscarded)
{
    ProverQueue queue(1, j_);

    std::promise<void> gate;
    auto released = gate.get_future().share();
    auto blocker = std::make_shared<ProverTask<int>>([released] {
        released.wait();
        return 1;
    });
    auto first = blocker->getFuture();
    queue.add(blocker);

    std::atomic<bool> ran{false};
    auto victim = std::make_shared<ProverTask<int>>([&ran] {
        ran = true;
        return 2;
    });
    auto second = victim->getFuture();
    queue.add(victim);
    victim->cancel();
    EXPECT_TRUE(victim->isCancelled());

    gate.set_value();
    EXPECT_EQ(first.get(), 1);
    EXPECT_THROW(second.get(), TimeoutError);
    EXPECT_FALSE(ran.load());
}

TEST_F(ProverQueueTest, CloseDiscardsQueuedWork)
{
    ProverQueue queue(1, j_);

    std::promise<void> gate;
    auto released = gate.get_future().share();
    auto blocker = std::make_shared<ProverTask<int>>([released] {
        released.wait();
        return 1;
    });
    auto first = blocker->getFuture();
    queue.add(blocker);

    auto queued = std::make_shared<ProverTask<int>>([] { return 2; });
    auto second = queued->getFuture();
    queue.add(queued);

    // The worker may or may not have picked up the blocker yet.
    std::thread closer([&queue] { queue.close(); });
    std::this_thread::sleep_for(20ms);
    gate.set_value();
    closer.join();

    EXPECT_THROW(second.get(), TimeoutError);
    EXPECT_THROW(queue.add(std::make_shared<ProverTask<int>>([] { return 3; })),
                 StateInvariantError);
    EXPECT_EQ(queue.pending(), 0u);
}

TEST_F(ProverQueueTest, FinishRunsQueuedWork)
{
    ProverQueue queue(1, j_);
    std::vector<std::future<int>> results;
    for (int i = 0; i < 4; ++i)
    {
        auto task = std::make_shared<ProverTask<int>>([i] {
            std::this_thread::sleep_for(5ms);
            return i;
        });
        results.push_back(task->getFuture());
        queue.add(task);
    }
    queue.finish();
    for (int i = 0; i < 4; ++i)
    {
        ASSERT_EQ(results[i].wait_for(0ms), std::future_status::ready);
        EXPECT_EQ(results[i].get(), i);
    }
    EXPECT_THROW(queue.add(std::make_shared<ProverTask<int>>([] { return 0; })),
                 StateInvariantError);
}

TEST_F(ProverQueueTest, RejectsZeroWorkers)
{
    EXPECT_THROW(ProverQueue(0, j_), InputValidationError);
}

}  // namespace
}  // namespace zkp
}  // namespace umbra
