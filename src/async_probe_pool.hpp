#ifndef SPACECHECK_SRC_ASYNC_PROBE_POOL_HPP_
#define SPACECHECK_SRC_ASYNC_PROBE_POOL_HPP_

#include "probe/capacity_probe.hpp"
#include "space/space_verdict.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

namespace SpaceCheck
{

class AsyncProbePool
{
    public:
    explicit AsyncProbePool(size_t num_threads = std::thread::hardware_concurrency());
    ~AsyncProbePool();

    AsyncProbePool(const AsyncProbePool&)            = delete;
    AsyncProbePool& operator=(const AsyncProbePool&) = delete;

    // Probes and evaluates one destination on a worker. `probe` must outlive the future.
    std::future<Space::SpaceVerdict> SubmitCheck(
        const Probe::CapacityProbe& probe, std::filesystem::path destination,
        std::int64_t required_bytes, Space::EvaluationPolicy policy
    );

    void SubmitTask(std::function<void()>&& task);

    size_t GetThreadCount() const { return workers_.size(); }

    private:
    void WorkerThread();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable condition_;
    bool stop_ = false;
};

}  // namespace SpaceCheck

#endif  // SPACECHECK_SRC_ASYNC_PROBE_POOL_HPP_
