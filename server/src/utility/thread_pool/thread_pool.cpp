#include <iostream>
#include <optional>

#include "thread_pool.h"
#include "store_mongoDB_error_and_exception.h"

void ThreadPool::submit(const std::function<void()>& job) {
    {
        std::scoped_lock<std::mutex> lock(thread_loop_mutex);
        jobs.push(job);
    }
    thread_loop_condition_variable.notify_one();
}

void ThreadPool::submit(std::function<void()>&& job) {
    {
        std::scoped_lock<std::mutex> lock(thread_loop_mutex);
        jobs.push(std::move(job));
    }
    thread_loop_condition_variable.notify_one();
}

void ThreadPool::stop_pool() {
    std::vector<std::jthread> threads_to_join;
    {
        std::scoped_lock<std::mutex> thread_lock(thread_loop_mutex);
        should_terminate = true;
        threads_to_join = std::move(threads);
        threads.clear();
    }
    thread_loop_condition_variable.notify_all();

    for (std::jthread& active_thread : threads_to_join) {
        active_thread.join();
    }

    std::scoped_lock<std::mutex> thread_lock(thread_loop_mutex);
    std::queue<std::function<void()>>().swap(jobs);
}

void ThreadPool::initialize_threads(const unsigned int threads_passed) {

    //smallest thread pool size is 1.
    const unsigned int num_threads = threads_passed > 1 ? threads_passed : 1;

    std::scoped_lock<std::mutex> lock(thread_loop_mutex);
    threads.reserve(num_threads);
    for (unsigned int i = 0; i < num_threads; i++) {
        threads.emplace_back(&ThreadPool::thread_loop, this);
    }
}

void ThreadPool::thread_loop() {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(thread_loop_mutex);
            thread_loop_condition_variable.wait(lock, [this] {
                return !jobs.empty() || should_terminate;
            });
            if (should_terminate) {
                return;
            }
            job = std::move(jobs.front());
            jobs.pop();
        }
        run_job(job);
    }
}

void ThreadPool::run_job(const std::function<void()>& job) {
    try {
        job();
    } catch (const std::exception& e) {
        const std::string error_string = "ThreadPool caught an unhandled exception.";
        storeMongoDBErrorAndException(
                __LINE__, __FILE__,
                std::optional<std::string>(e.what()), error_string
        );
    } catch (...) {
        const std::string error_string = "ThreadPool caught an unhandled exception not derived from std::exception.";
        storeMongoDBErrorAndException(
                __LINE__, __FILE__,
                std::optional<std::string>(), error_string
        );
    }
}
