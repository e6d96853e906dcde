#include <gtest/gtest.h>
#include "../main/src/utils.hpp"
#include "../main/src/config.hpp"
#include "test_helpers.hpp"

#include <future>
#include <thread>
#include <vector>

class LockTest : public ::testing::Test {
protected:
    fs::path test_root;
    Layout layout;

    void SetUp() override {
        init_test_localization();
        test_root = make_test_root("lock");
        layout = Layout::from_base(test_root);
        init_filesystem(layout);
    }

    void TearDown() override {
        fs::remove_all(test_root);
    }
};

TEST_F(LockTest, BasicLocking) {
    // 1. Acquire lock
    std::unique_ptr<InstallLock> lock1;
    EXPECT_NO_THROW(lock1 = std::make_unique<InstallLock>(layout.lock_file));

    // 2. A non-blocking attempt while the first is held fails
    try {
        InstallLock lock2(layout.lock_file, LockMode::NoWait);
        FAIL() << "second lock acquired";
    } catch (const VpkgException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Locked);
    }
}

TEST_F(LockTest, LockReleaseAndReacquire) {
    {
        InstallLock lock1(layout.lock_file);
    } // lock1 released here

    EXPECT_NO_THROW(InstallLock lock2(layout.lock_file, LockMode::NoWait));
}

TEST_F(LockTest, CreatesMissingParentDirectory) {
    const fs::path lock_file = test_root / "nested" / "dir" / ".vpkg.lock";
    EXPECT_NO_THROW(InstallLock lock(lock_file));
    EXPECT_TRUE(fs::exists(lock_file));
}

TEST_F(LockTest, ConcurrencyTest) {
    std::promise<void> acquired;
    std::promise<void> release;
    auto acquired_future = acquired.get_future();
    auto release_future = release.get_future();

    // Thread 1 acquires lock and waits
    std::thread t1([&]() {
        InstallLock lock(layout.lock_file);
        acquired.set_value();
        release_future.wait();
    });

    acquired_future.wait();

    EXPECT_THROW(InstallLock lock2(layout.lock_file, LockMode::NoWait), VpkgException);

    release.set_value();
    t1.join();

    EXPECT_NO_THROW(InstallLock lock3(layout.lock_file, LockMode::NoWait));
}

TEST_F(LockTest, WaitingLockBlocksUntilReleased) {
    std::atomic<bool> released{false};
    std::atomic<bool> second_acquired{false};
    bool observed_release = false;

    auto holder = std::make_unique<InstallLock>(layout.lock_file);
    std::thread waiter([&]() {
        InstallLock lock(layout.lock_file);
        observed_release = released.load();
        second_acquired = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_FALSE(second_acquired.load());

    released = true;
    holder.reset();
    waiter.join();

    EXPECT_TRUE(second_acquired.load());
    EXPECT_TRUE(observed_release);
}

TEST_F(LockTest, MultipleThreadsAreSerialised) {
    const int num_threads = 8;
    std::atomic<int> inside{0};
    std::atomic<int> max_inside{0};

    auto critical_section = [&]() {
        InstallLock lock(layout.lock_file);
        int now = ++inside;
        int expected = max_inside.load();
        while (now > expected && !max_inside.compare_exchange_weak(expected, now)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        --inside;
    };

    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back(critical_section);
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(max_inside.load(), 1);
}
