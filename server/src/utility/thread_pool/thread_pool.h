#pragma once

#include <queue>
#include <mutex>
#include <atomic>
#include <thread>
#include <vector>
#include <functional>
#include <condition_variable>

//Fixed size pool of std::jthread workers pulling std::function<void()> jobs from a single queue.
//Jobs are expected to handle their own errors, any exception escaping a job is stored and the worker
// continues with the next job.
class ThreadPool {
public:

    ThreadPool() {
        initialize_threads(std::thread::hardware_concurrency());
    }

    explicit ThreadPool(const unsigned int num_threads) {
        initialize_threads(num_threads);
    }

    ThreadPool(ThreadPool& copy) = delete;

    ThreadPool(ThreadPool&& move) = delete;

    ThreadPool& operator=(const ThreadPool& rhs) = delete;

    ~ThreadPool() {
        stop_pool();
    }

    void submit(const std::function<void()>& job);

    void submit(std::function<void()>&& job);

    //Workers finish their current job and exit, jobs still inside the queue are discarded. Safe to call
    // more than once.
    void stop_pool();

    //NOTE: This is meant for testing purposes.
    size_t num_jobs_outstanding() {
        std::scoped_lock<std::mutex> thread_lock(thread_loop_mutex);
        return jobs.size();
    }

    size_t num_threads() {
        std::scoped_lock<std::mutex> thread_lock(thread_loop_mutex);
        return threads.size();
    }

private:

    void initialize_threads(unsigned int num_threads);

    void thread_loop();

    static void run_job(const std::function<void()>& job);

    bool should_terminate = false;

    std::mutex thread_loop_mutex;

    std::condition_variable thread_loop_condition_variable;

    std::vector<std::jthread> threads;

    std::queue<std::function<void()>> jobs;
};
