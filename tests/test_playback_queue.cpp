/**
 * @file test_playback_queue.cpp
 * @brief Tests for gapless FIFO playback over a scripted sink
 */

#include <gtest/gtest.h>

#include <memory>
#include <thread>
#include <vector>

#include "rtv/audio/rtv_playback_queue.h"
#include "test_fakes.h"

using rtv_test::FakeSink;
using rtv_test::SinkTap;
using rtv_test::make_unit;

namespace {

struct QueueFixture {
    std::shared_ptr<SinkTap> tap = std::make_shared<SinkTap>();
    rtv::PlaybackQueue queue{std::make_unique<FakeSink>(tap)};
};

}  // namespace

// =============================================================================
// ORDERING
// =============================================================================

TEST(PlaybackQueue, PlaysUnitsInEnqueueOrder) {
    QueueFixture f;
    for (uint64_t i = 0; i < 5; ++i) {
        ASSERT_EQ(f.queue.enqueue(make_unit(i)), RTV_SUCCESS);
    }

    // Only the head starts until it completes
    EXPECT_EQ(f.tap->started_count(), 1u);
    EXPECT_EQ(f.queue.pending(), 4u);

    while (f.tap->complete_current()) {
    }

    EXPECT_EQ(f.tap->started, (std::vector<uint64_t>{0, 1, 2, 3, 4}));
    EXPECT_EQ(f.tap->max_active, 1);
    EXPECT_FALSE(f.queue.is_playing());
    EXPECT_EQ(f.queue.stats().completed, 5u);
}

TEST(PlaybackQueue, IdleQueueStartsNextEnqueueImmediately) {
    QueueFixture f;
    ASSERT_EQ(f.queue.enqueue(make_unit(0)), RTV_SUCCESS);
    ASSERT_TRUE(f.tap->complete_current());
    EXPECT_FALSE(f.queue.is_playing());

    ASSERT_EQ(f.queue.enqueue(make_unit(1)), RTV_SUCCESS);
    EXPECT_TRUE(f.queue.is_playing());
    EXPECT_EQ(f.tap->started, (std::vector<uint64_t>{0, 1}));
}

TEST(PlaybackQueue, ConcurrentProducerAndConsumerKeepOrder) {
    QueueFixture f;
    const uint64_t kUnits = 200;

    std::thread producer([&] {
        for (uint64_t i = 0; i < kUnits; ++i) {
            ASSERT_EQ(f.queue.enqueue(make_unit(i, 16)), RTV_SUCCESS);
        }
    });

    size_t completed = 0;
    while (completed < kUnits) {
        if (f.tap->complete_current()) {
            completed++;
        } else {
            std::this_thread::yield();
        }
    }
    producer.join();

    ASSERT_EQ(f.tap->started.size(), kUnits);
    for (uint64_t i = 0; i < kUnits; ++i) {
        EXPECT_EQ(f.tap->started[i], i);
    }
    EXPECT_EQ(f.tap->max_active, 1);
}

// =============================================================================
// RESUME
// =============================================================================

TEST(PlaybackQueue, ResumesSuspendedSinkOncePerSession) {
    QueueFixture f;
    ASSERT_TRUE(f.tap->suspended);

    ASSERT_EQ(f.queue.enqueue(make_unit(0)), RTV_SUCCESS);
    ASSERT_EQ(f.queue.enqueue(make_unit(1)), RTV_SUCCESS);
    EXPECT_EQ(f.tap->resume_calls, 1);

    f.queue.begin_session();
    f.tap->suspended = true;
    ASSERT_EQ(f.queue.enqueue(make_unit(2)), RTV_SUCCESS);
    EXPECT_EQ(f.tap->resume_calls, 2);
}

TEST(PlaybackQueue, DoesNotResumeActiveSink) {
    QueueFixture f;
    f.tap->suspended = false;
    ASSERT_EQ(f.queue.enqueue(make_unit(0)), RTV_SUCCESS);
    EXPECT_EQ(f.tap->resume_calls, 0);
}

// =============================================================================
// STOP
// =============================================================================

TEST(PlaybackQueue, StopHaltsAndDiscardsEverything) {
    QueueFixture f;
    for (uint64_t i = 0; i < 4; ++i) {
        ASSERT_EQ(f.queue.enqueue(make_unit(i)), RTV_SUCCESS);
    }

    f.queue.stop();

    EXPECT_FALSE(f.queue.is_playing());
    EXPECT_EQ(f.queue.pending(), 0u);
    EXPECT_EQ(f.tap->halt_calls, 1);
    EXPECT_EQ(f.queue.stats().discarded, 4u);
    // Nothing else starts after the stop
    EXPECT_FALSE(f.tap->complete_current());
    EXPECT_EQ(f.tap->started_count(), 1u);
}

TEST(PlaybackQueue, StopIsIdempotent) {
    QueueFixture f;
    f.queue.stop();
    f.queue.stop();
    EXPECT_FALSE(f.queue.is_playing());
    EXPECT_EQ(f.queue.stats().discarded, 0u);
}

TEST(PlaybackQueue, LateCompletionAfterStopIsIgnored) {
    QueueFixture f;
    ASSERT_EQ(f.queue.enqueue(make_unit(0)), RTV_SUCCESS);

    // Grab the completion before stop() clears it, as a racing sink would
    rtv::AudioSink::CompletionFn late;
    {
        std::lock_guard<std::mutex> lock(f.tap->mutex);
        late = f.tap->completions.front();
    }
    f.queue.stop();

    ASSERT_EQ(f.queue.enqueue(make_unit(1)), RTV_SUCCESS);
    late();

    // Unit 1 is still the one sounding
    EXPECT_TRUE(f.queue.is_playing());
    EXPECT_EQ(f.queue.stats().completed, 0u);
    EXPECT_EQ(f.tap->started, (std::vector<uint64_t>{0, 1}));
}

TEST(PlaybackQueue, EnqueueAfterStopStartsFresh) {
    QueueFixture f;
    ASSERT_EQ(f.queue.enqueue(make_unit(0)), RTV_SUCCESS);
    ASSERT_EQ(f.queue.enqueue(make_unit(1)), RTV_SUCCESS);
    f.queue.stop();

    ASSERT_EQ(f.queue.enqueue(make_unit(7)), RTV_SUCCESS);
    ASSERT_TRUE(f.tap->complete_current());
    EXPECT_EQ(f.tap->started, (std::vector<uint64_t>{0, 7}));
}

TEST(PlaybackQueue, ReleaseClosesSink) {
    QueueFixture f;
    ASSERT_EQ(f.queue.enqueue(make_unit(0)), RTV_SUCCESS);
    f.queue.release();
    EXPECT_EQ(f.tap->close_calls, 1);
    EXPECT_FALSE(f.queue.is_playing());
}
