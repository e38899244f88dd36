// =============================================================================
// BlockingQueue and batch producer
// =============================================================================

#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "queue.hpp"
#include "threads/batcher.hpp"

using namespace stormagg;

TEST(QueueTest, PopsInPushOrderAndDrainsAfterClose) {
    BlockingQueue<int> queue(0);
    EXPECT_TRUE(queue.push(1));
    EXPECT_TRUE(queue.push(2));
    queue.close();
    EXPECT_FALSE(queue.push(3));

    int value = 0;
    ASSERT_TRUE(queue.pop(value));
    EXPECT_EQ(value, 1);
    ASSERT_TRUE(queue.pop(value));
    EXPECT_EQ(value, 2);
    EXPECT_FALSE(queue.pop(value));
}

TEST(QueueTest, CancelDropsQueuedItems) {
    BlockingQueue<int> queue(0);
    queue.push(1);
    queue.push(2);
    queue.cancel();

    int value = 0;
    EXPECT_FALSE(queue.pop(value));
    EXPECT_FALSE(queue.push(4));
}

// A full bounded queue blocks the producer until a consumer makes room.
TEST(QueueTest, BoundedQueueHandsOffAcrossThreads) {
    BlockingQueue<int> queue(2);
    std::thread producer([&queue]() {
        for (int i = 0; i < 100; ++i) {
            queue.push(i);
        }
        queue.close();
    });

    std::vector<int> received;
    int value = 0;
    while (queue.pop(value)) {
        received.push_back(value);
    }
    producer.join();

    ASSERT_EQ(received.size(), 100u);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(received[i], i);
    }
}

TEST(BatcherTest, CoversEveryIndexOnce) {
    BlockingQueue<EventBatch> queue(0);
    batcherThread(10, 4, queue);
    EXPECT_FALSE(queue.push(EventBatch()));

    std::vector<EventBatch> batches;
    EventBatch batch;
    while (queue.pop(batch)) {
        batches.push_back(batch);
    }
    ASSERT_EQ(batches.size(), 3u);
    EXPECT_EQ(batches[0].begin, 0u);
    EXPECT_EQ(batches[0].end, 4u);
    EXPECT_EQ(batches[1].begin, 4u);
    EXPECT_EQ(batches[1].end, 8u);
    EXPECT_EQ(batches[2].begin, 8u);
    EXPECT_EQ(batches[2].end, 10u);
}

TEST(BatcherTest, NoEventsMeansNoBatches) {
    BlockingQueue<EventBatch> queue(0);
    batcherThread(0, 4, queue);

    EventBatch batch;
    EXPECT_FALSE(queue.pop(batch));
}

// A cancelled queue makes the producer give up at its first push.
TEST(BatcherTest, StopsWhenConsumersCancel) {
    BlockingQueue<EventBatch> queue(1);
    queue.cancel();
    batcherThread(1000, 1, queue);

    EventBatch batch;
    EXPECT_FALSE(queue.pop(batch));
}
