#include <atomic>
#include <future>
#include <chrono>
#include <thread>
#include <stdexcept>

#include "gtest/gtest.h"

#include "thread_pool.h"

TEST(ThreadPoolTesting, minimumOneThread) {
    ThreadPool thread_pool(0);

    EXPECT_EQ(thread_pool.num_threads(), 1);
}

TEST(ThreadPoolTesting, runsEverySubmittedJob) {
    ThreadPool thread_pool(4);

    const int number_jobs = 200;
    std::atomic_int number_run = 0;
    std::promise<void> all_done;

    for (int i = 0; i < number_jobs; ++i) {
        thread_pool.submit([&] {
            if (++number_run == number_jobs) {
                all_done.set_value();
            }
        });
    }

    ASSERT_EQ(all_done.get_future().wait_for(std::chrono::seconds{10}), std::future_status::ready);
    EXPECT_EQ(number_run, number_jobs);
}

TEST(ThreadPoolTesting, exceptionDoesNotKillWorker) {
    ThreadPool thread_pool(1);

    std::promise<void> second_job_ran;

    thread_pool.submit([] {
        throw std::runtime_error("job failed");
    });

    thread_pool.submit([&] {
        second_job_ran.set_value();
    });

    //the exception is stored in the database before the worker moves on
    EXPECT_EQ(second_job_ran.get_future().wait_for(std::chrono::seconds{60}), std::future_status::ready);
}

TEST(ThreadPoolTesting, nonStandardExceptionDoesNotKillWorker) {
    ThreadPool thread_pool(1);

    std::promise<void> second_job_ran;

    thread_pool.submit([] {
        throw 42;
    });

    thread_pool.submit([&] {
        second_job_ran.set_value();
    });

    EXPECT_EQ(second_job_ran.get_future().wait_for(std::chrono::seconds{60}), std::future_status::ready);
    EXPECT_EQ(thread_pool.num_threads(), 1);
}

TEST(ThreadPoolTesting, stopPool_discardsQueuedJobs) {
    ThreadPool thread_pool(1);

    std::promise<void> release_first_job;
    std::shared_future<void> release_future = release_first_job.get_future().share();
    std::promise<void> first_job_started;
    std::atomic_bool second_job_ran = false;

    thread_pool.submit([&] {
        first_job_started.set_value();
        release_future.wait();
    });

    thread_pool.submit([&] {
        second_job_ran = true;
    });

    first_job_started.get_future().wait();
    EXPECT_EQ(thread_pool.num_jobs_outstanding(), 1);

    std::thread stopping_thread([&] {
        thread_pool.stop_pool();
    });

    //threads are moved out after the pool is marked as terminating
    while (thread_pool.num_threads() != 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds{1});
    }

    release_first_job.set_value();
    stopping_thread.join();

    EXPECT_FALSE(second_job_ran);
    EXPECT_EQ(thread_pool.num_jobs_outstanding(), 0);
    EXPECT_EQ(thread_pool.num_threads(), 0);

    //calling it again is a no-op
    thread_pool.stop_pool();
}
