#include <atomic>
#include <thread>
#include "gtest/gtest.h"
#include "common/semaphore.hpp"

using namespace std;
using namespace runbox;

TEST(SemaphoreTest, TryAcquireTest) {
    semaphore sem(2);
    EXPECT_TRUE(sem.try_acquire());
    EXPECT_TRUE(sem.try_acquire());
    EXPECT_FALSE(sem.try_acquire());
    EXPECT_EQ(sem.in_use(), 2u);

    sem.release();
    EXPECT_TRUE(sem.try_acquire());
}

TEST(SemaphoreTest, UnlimitedTest) {
    semaphore sem(0);
    for (int i = 0; i < 100; ++i)
        EXPECT_TRUE(sem.try_acquire());
    EXPECT_EQ(sem.in_use(), 100u);
    EXPECT_EQ(sem.capacity(), 0u);
}

TEST(SemaphoreTest, PermitTest) {
    semaphore sem(1);
    {
        sem.acquire();
        semaphore_permit permit(sem);
        EXPECT_FALSE(sem.try_acquire());

        semaphore_permit moved(move(permit));
        EXPECT_EQ(sem.in_use(), 1u);
    }
    EXPECT_EQ(sem.in_use(), 0u);
}

TEST(SemaphoreTest, BlockingAcquireTest) {
    semaphore sem(2);
    atomic<int> running(0), peak(0);

    vector<thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            sem.acquire();
            semaphore_permit permit(sem);
            int now = ++running;
            int expected = peak.load();
            while (now > expected && !peak.compare_exchange_weak(expected, now))
                ;
            this_thread::sleep_for(chrono::milliseconds(20));
            --running;
        });
    }
    for (auto &th : threads) th.join();

    EXPECT_LE(peak.load(), 2);
    EXPECT_EQ(sem.in_use(), 0u);
}
