#include <gtest/gtest.h>
#include "NutrientField.h"
#include "ParallelProcessor.h"
#include "SimulationRng.h"
#include <atomic>
#include <stdexcept>
#include <vector>

TEST(ParallelProcessorTest, CoversEveryIndexExactlyOnce)
{
    ParallelProcessor processor(4);
    EXPECT_EQ(processor.getThreadCount(), 4u);

    std::vector<int> hits(1000, 0);
    processor.parallelRange(hits.size(), [&hits](size_t begin, size_t end)
                            {
        for (size_t i = begin; i < end; ++i)
            ++hits[i]; });

    for (int h : hits)
        ASSERT_EQ(h, 1);
    EXPECT_EQ(processor.getMetrics().totalOperations, 1u);
}

TEST(ParallelProcessorTest, SmallWorkRunsInline)
{
    ParallelProcessor processor(8);
    std::atomic<int> calls{0};
    processor.parallelRange(5, [&calls](size_t begin, size_t end)
                            {
        EXPECT_EQ(begin, 0u);
        EXPECT_EQ(end, 5u);
        ++calls; });
    EXPECT_EQ(calls.load(), 1);

    processor.parallelRange(0, [&calls](size_t, size_t)
                            { ++calls; });
    EXPECT_EQ(calls.load(), 1);
}

TEST(ParallelProcessorTest, TaskExceptionsReachTheCaller)
{
    ParallelProcessor processor(2);
    EXPECT_THROW(processor.parallelRange(100, [](size_t begin, size_t)
                                         {
        if (begin > 0)
            throw std::runtime_error("worker failed"); }),
                 std::runtime_error);
}

TEST(ParallelProcessorTest, ParallelDiffusionMatchesSerial)
{
    SimulationRng firstRng(21);
    SimulationRng secondRng(21);
    NutrientField serial(64);
    NutrientField parallel(64);
    serial.seedPatches(firstRng);
    parallel.seedPatches(secondRng);
    serial.setBlocked(10, 10, true);
    parallel.setBlocked(10, 10, true);

    ParallelProcessor processor(3);
    for (int i = 0; i < 25; ++i)
    {
        serial.diffuse(0.4f, 0.7f, 0.0f);
        parallel.diffuse(0.4f, 0.7f, 0.0f, &processor);
    }

    for (NutrientField::Channel channel : {NutrientField::Channel::Sugar, NutrientField::Channel::Nitrogen})
    {
        const float *a = serial.getData(channel);
        const float *b = parallel.getData(channel);
        for (size_t i = 0; i < serial.getDataSize(); ++i)
            ASSERT_EQ(a[i], b[i]) << "cell " << i;
    }
}
