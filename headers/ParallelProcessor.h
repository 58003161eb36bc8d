#pragma once
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <future>
#include <vector>

/**
 * splits row ranges of the field grids over async tasks
 * every task writes a disjoint block of rows, so results never depend on the thread count
 */
class ParallelProcessor
{
public:
    struct PerformanceMetrics
    {
        double avgExecutionTime = 0.0; // milliseconds
        double maxExecutionTime = 0.0;
        size_t totalOperations = 0;
    };

    // 0 picks all cores but one
    explicit ParallelProcessor(size_t numThreads = 0);
    ~ParallelProcessor() = default;

    // calls func(begin, end) over contiguous chunks of [0, count) and waits for all of them;
    // the first exception thrown by a task is rethrown here
    template <typename Function>
    void parallelRange(size_t count, Function &&func)
    {
        if (count == 0)
            return;

        if (numThreads_ <= 1 || count < numThreads_ * 2)
        {
            // too little work for parallelization overhead
            func(static_cast<size_t>(0), count);
            return;
        }

        auto start = std::chrono::high_resolution_clock::now();

        const size_t chunkSize = calculateChunkSize(count);
        std::vector<std::future<void>> futures;
        futures.reserve(numThreads_);

        for (size_t threadId = 0; threadId < numThreads_; ++threadId)
        {
            size_t begin = threadId * chunkSize;
            size_t end = std::min(begin + chunkSize, count);
            if (begin >= count)
                break;

            futures.emplace_back(std::async(std::launch::async, [&func, begin, end]()
                                            { func(begin, end); }));
        }

        for (auto &future : futures)
            future.get();

        auto finish = std::chrono::high_resolution_clock::now();
        recordRun(std::chrono::duration<double, std::milli>(finish - start).count());
    }

    size_t getThreadCount() const { return numThreads_; }

    PerformanceMetrics getMetrics() const { return metrics_; }
    void resetMetrics() { metrics_ = PerformanceMetrics{}; }

private:
    size_t numThreads_;
    PerformanceMetrics metrics_;

    static size_t getOptimalThreadCount();
    size_t calculateChunkSize(size_t totalWork) const;
    void recordRun(double milliseconds);
};
