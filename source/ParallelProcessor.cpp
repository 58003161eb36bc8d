#include "ParallelProcessor.h"
#include <thread>

ParallelProcessor::ParallelProcessor(size_t numThreads)
{
    numThreads_ = (numThreads == 0) ? getOptimalThreadCount() : numThreads;
}

size_t ParallelProcessor::getOptimalThreadCount()
{
    size_t hwThreads = std::thread::hardware_concurrency();
    if (hwThreads == 0)
        hwThreads = 4;

    // leave one core for the caller
    return std::max(static_cast<size_t>(1), hwThreads - 1);
}

size_t ParallelProcessor::calculateChunkSize(size_t totalWork) const
{
    return (totalWork + numThreads_ - 1) / numThreads_; // ceiling division
}

void ParallelProcessor::recordRun(double milliseconds)
{
    metrics_.totalOperations++;
    metrics_.avgExecutionTime += (milliseconds - metrics_.avgExecutionTime) / static_cast<double>(metrics_.totalOperations);
    metrics_.maxExecutionTime = std::max(metrics_.maxExecutionTime, milliseconds);
}
