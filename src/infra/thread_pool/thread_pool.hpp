#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <thread>
#include <mutex>
#include <queue>
#include <condition_variable>
#include <stop_token>
#include <vector>
#include <stdexcept>

namespace copysort::infra {

class ThreadPool {
public:
    explicit ThreadPool(std::size_t nthreads = std::jthread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Запуск задачи без возврата
    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args) -> void;

    // Запуск задачи с возвратом (future)
    template<typename F, typename... Args>
    auto enqueue_with_future(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>>;

    // Блокирующее ожидание завершения всех задач
    void wait();

    [[nodiscard]] auto size() const -> std::size_t { return workers_.size(); }

private:
    using Task = std::function<void()>;

    void worker_loop_(std::stop_token st);

    std::queue<Task> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any task_cv_;   // будит рабочие потоки
    std::condition_variable done_cv_;       // будит wait()
    bool stop_ = false;
    std::size_t active_tasks_ = 0;          // в очереди + выполняются, под queue_mutex_

    // Последним: потоки должны завершиться до разрушения очереди
    std::vector<std::jthread> workers_;
};

// =============== Реализация шаблонов ===============

template<typename F, typename... Args>
void ThreadPool::enqueue(F&& f, Args&&... args) {
    // future не нужен, исключения задачи остаются в нём
    (void)enqueue_with_future(std::forward<F>(f), std::forward<Args>(args)...);
}

template<typename F, typename... Args>
auto ThreadPool::enqueue_with_future(F&& f, Args&&... args)
    -> std::future<std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>>
{
    using ReturnType = std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>;

    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    auto future = task->get_future();
    {
        std::lock_guard lock(queue_mutex_);
        if (stop_) {
            throw std::runtime_error("ThreadPool is stopped");
        }
        ++active_tasks_;
        tasks_.emplace([task]() { (*task)(); });
    }
    task_cv_.notify_one();
    return future;
}

inline ThreadPool::ThreadPool(std::size_t nthreads) {
    if (nthreads == 0) nthreads = 1;
    workers_.reserve(nthreads);

    for (std::size_t i = 0; i < nthreads; ++i) {
        workers_.emplace_back([this](std::stop_token st) { worker_loop_(st); });
    }
}

inline ThreadPool::~ThreadPool() {
    {
        std::lock_guard lock(queue_mutex_);
        stop_ = true;
    }
    task_cv_.notify_all();
    // jthread сам вызовет request_stop и join; оставшиеся задачи дорабатываются
}

inline void ThreadPool::worker_loop_(std::stop_token st) {
    for (;;) {
        Task task;
        {
            std::unique_lock lock(queue_mutex_);
            task_cv_.wait(lock, st, [this] {
                return !tasks_.empty() || stop_;
            });

            if (tasks_.empty()) {
                return; // stop_ или request_stop при пустой очереди
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        task();

        {
            std::lock_guard lock(queue_mutex_);
            --active_tasks_;
        }
        done_cv_.notify_all();
    }
}

inline void ThreadPool::wait() {
    std::unique_lock lock(queue_mutex_);
    done_cv_.wait(lock, [this] { return active_tasks_ == 0; });
}

} // namespace copysort::infra
