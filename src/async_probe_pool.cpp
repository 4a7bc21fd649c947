#include "async_probe_pool.hpp"

#include "space/space_evaluator.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <stdexcept>
#include <utility>

namespace SpaceCheck
{

AsyncProbePool::AsyncProbePool(size_t num_threads)
{
    if (num_threads == 0) {
        num_threads = 1;
    }
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this] {
            this->WorkerThread();
        });
    }
    spdlog::debug("AsyncProbePool started with {} workers", num_threads);
}

AsyncProbePool::~AsyncProbePool()
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();
    for (std::thread& worker : workers_) {
        worker.join();
    }
}

void AsyncProbePool::WorkerThread()
{
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] {
                return this->stop_ || !this->tasks_.empty();
            });
            if (this->stop_ && this->tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        task();
    }
}

void AsyncProbePool::SubmitTask(std::function<void()>&& task)
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_) {
            throw std::runtime_error("AsyncProbePool is shutting down");
        }
        tasks_.emplace_back(std::move(task));
    }
    condition_.notify_one();
}

std::future<Space::SpaceVerdict> AsyncProbePool::SubmitCheck(
    const Probe::CapacityProbe& probe, std::filesystem::path destination,
    std::int64_t required_bytes, Space::EvaluationPolicy policy
)
{
    auto task_ptr = std::make_shared<std::packaged_task<Space::SpaceVerdict()>>(
        [&probe, destination = std::move(destination), required_bytes, policy]() {
            return Space::Evaluate(destination, probe.Probe(destination), required_bytes, policy);
        }
    );

    std::future<Space::SpaceVerdict> future = task_ptr->get_future();

    SubmitTask([task_ptr]() {
        (*task_ptr)();
    });

    return future;
}

}  // namespace SpaceCheck
