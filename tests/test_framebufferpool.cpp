#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "framebufferpool.h"

namespace {

FrameBuffer makeFrame(int rows = 8, int cols = 8)
{
    return FrameBuffer::fromMat(cv::Mat(rows, cols, CV_8UC3, cv::Scalar(10, 20, 30)));
}

} // namespace

TEST(FrameBufferTest, FromMatCopiesPixels)
{
    cv::Mat source(4, 6, CV_8UC3, cv::Scalar(1, 2, 3));
    FrameBuffer buffer = FrameBuffer::fromMat(source);

    ASSERT_TRUE(buffer.isValid());
    EXPECT_EQ(buffer.width(), 6);
    EXPECT_EQ(buffer.height(), 4);
    EXPECT_EQ(buffer.size(), 4u * 6u * 3u);
    EXPECT_NE(buffer.data(), source.data);
    EXPECT_EQ(cv::norm(buffer.getMatView(), source, cv::NORM_INF), 0.0);
}

TEST(FrameBufferTest, EmptyMatGivesInvalidBuffer)
{
    FrameBuffer buffer = FrameBuffer::fromMat(cv::Mat());
    EXPECT_FALSE(buffer.isValid());
    EXPECT_EQ(buffer.size(), 0u);
}

TEST(FrameBufferTest, MoveLeavesSourceEmpty)
{
    FrameBuffer first = makeFrame();
    uint8_t* data = first.data();

    FrameBuffer second = std::move(first);
    EXPECT_FALSE(first.isValid());
    EXPECT_EQ(first.data(), nullptr);
    EXPECT_TRUE(second.isValid());
    EXPECT_EQ(second.data(), data);
}

TEST(FrameBufferTest, DataIsAligned)
{
    FrameBuffer buffer = makeFrame(3, 5);
    ASSERT_TRUE(buffer.isValid());
    EXPECT_EQ(reinterpret_cast<uintptr_t>(buffer.data()) % 32, 0u);
}

TEST(FrameBufferPoolTest, AddAssignsIncreasingIds)
{
    FrameBufferPool pool(4);
    quint64 a = pool.add(makeFrame());
    quint64 b = pool.add(makeFrame());
    quint64 c = pool.add(makeFrame());

    EXPECT_LT(a, b);
    EXPECT_LT(b, c);
    EXPECT_EQ(pool.count(), 3);
}

TEST(FrameBufferPoolTest, FullPoolEvictsOldestFirst)
{
    FrameBufferPool pool(3);
    quint64 first = pool.add(makeFrame());
    quint64 second = pool.add(makeFrame());
    pool.add(makeFrame());
    pool.add(makeFrame());

    EXPECT_EQ(pool.count(), 3);
    EXPECT_FALSE(pool.take(first).has_value());
    EXPECT_TRUE(pool.take(second).has_value());

    BufferPoolDiagnostics info = pool.diagnostics();
    EXPECT_EQ(info.totalAllocated, 4u);
    EXPECT_EQ(info.totalEvicted, 1u);
}

TEST(FrameBufferPoolTest, CountNeverExceedsCapacity)
{
    FrameBufferPool pool;
    for (int i = 0; i < 250; ++i) {
        pool.add(makeFrame(2, 2));
        ASSERT_LE(pool.count(), FrameBufferPool::DEFAULT_MAX_BUFFERS);
    }
    EXPECT_EQ(pool.count(), 100);
    EXPECT_EQ(pool.diagnostics().totalEvicted, 150u);
}

TEST(FrameBufferPoolTest, ReleaseUnknownIdIsIgnored)
{
    FrameBufferPool pool(2);
    quint64 id = pool.add(makeFrame());

    pool.release(id + 100);
    EXPECT_EQ(pool.count(), 1);

    pool.release(id);
    pool.release(id);
    EXPECT_EQ(pool.count(), 0);
    EXPECT_EQ(pool.diagnostics().totalReleased, 1u);
}

TEST(FrameBufferPoolTest, ReleaseAllEmptiesPoolAndMemory)
{
    FrameBufferPool pool(10);
    for (int i = 0; i < 5; ++i) {
        pool.add(makeFrame(64, 64));
    }
    EXPECT_GT(pool.diagnostics().estimatedMemoryMB, 0.0);

    EXPECT_EQ(pool.releaseAll(), 5);
    BufferPoolDiagnostics info = pool.diagnostics();
    EXPECT_EQ(info.currentCount, 0);
    EXPECT_DOUBLE_EQ(info.estimatedMemoryMB, 0.0);
    EXPECT_FALSE(info.oldestBufferAgeSeconds.has_value());
    EXPECT_EQ(pool.releaseAll(), 0);
}

TEST(FrameBufferPoolTest, TakeOldestMovesPayloadOut)
{
    FrameBufferPool pool(4);
    quint64 first = pool.add(makeFrame(4, 4));
    pool.add(makeFrame(6, 6));

    std::optional<FrameHandle> handle = pool.takeOldest();
    ASSERT_TRUE(handle.has_value());
    EXPECT_EQ(handle->id, first);
    EXPECT_TRUE(handle->frame.isValid());
    EXPECT_EQ(handle->frame.width(), 4);
    EXPECT_EQ(pool.count(), 1);

    pool.takeOldest();
    EXPECT_FALSE(pool.takeOldest().has_value());
}

TEST(FrameBufferPoolTest, DiagnosticsReportOldestAge)
{
    FrameBufferPool pool(4);
    EXPECT_FALSE(pool.diagnostics().oldestBufferAgeSeconds.has_value());

    pool.add(makeFrame());
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    BufferPoolDiagnostics info = pool.diagnostics();
    ASSERT_TRUE(info.oldestBufferAgeSeconds.has_value());
    EXPECT_GE(*info.oldestBufferAgeSeconds, 0.015);
    EXPECT_EQ(info.maxBuffers, 4);
}

TEST(FrameBufferPoolTest, ConcurrentProducersStayBounded)
{
    FrameBufferPool pool(16);
    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([&pool]() {
            for (int i = 0; i < 200; ++i) {
                quint64 id = pool.add(makeFrame(2, 2));
                if (i % 3 == 0) {
                    pool.release(id);
                }
            }
        });
    }
    std::thread reader([&pool]() {
        for (int i = 0; i < 500; ++i) {
            BufferPoolDiagnostics info = pool.diagnostics();
            ASSERT_LE(info.currentCount, 16);
        }
    });

    for (auto& producer : producers) {
        producer.join();
    }
    reader.join();

    BufferPoolDiagnostics info = pool.diagnostics();
    EXPECT_LE(info.currentCount, 16);
    EXPECT_EQ(info.totalAllocated, 800u);
    EXPECT_EQ(info.totalAllocated - info.totalEvicted - info.totalReleased,
              static_cast<quint64>(info.currentCount));
}
