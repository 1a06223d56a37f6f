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
#include <atomic>

namespace objcp::infra {

class ThreadPool {
public:
    explicit ThreadPool(std::size_t nthreads = std::jthread::hardware_concurrency());
    ~ThreadPool();

    // Удалить копирование и присваивание
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

    // Blocks while `limit` or more tasks are queued or running, so a lazy
    // producer never runs far ahead of the workers.
    void wait_for_capacity(std::size_t limit);

    [[nodiscard]] auto size() const -> std::size_t { return workers_.size(); }

private:
    using Task = std::packaged_task<void()>;

    std::vector<std::jthread> workers_;
    std::queue<Task> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any cv_;
    bool stop_ = false;
    std::atomic<std::size_t> active_tasks_{0}; // queued + running
};

// =============== Реализация шаблонов ===============

template<typename F, typename... Args>
void ThreadPool::enqueue(F&& f, Args&&... args) {
    enqueue_with_future(std::forward<F>(f), std::forward<Args>(args)...);
    // Игнорируем future, задача запущена
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
        active_tasks_.fetch_add(1, std::memory_order_relaxed);
        tasks_.emplace([task, this]() {
            (*task)();
            {
                // под мьютексом, иначе wait() может пропустить уведомление
                std::lock_guard done_lock(queue_mutex_);
                active_tasks_.fetch_sub(1, std::memory_order_relaxed);
            }
            cv_.notify_all();
        });
    }
    cv_.notify_all();
    return future;
}

} // namespace objcp::infra

namespace objcp::infra {

inline ThreadPool::ThreadPool(std::size_t nthreads)
    : stop_(false)
{
    if (nthreads == 0) nthreads = 1;
    workers_.reserve(nthreads);

    for (std::size_t i = 0; i < nthreads; ++i) {
        workers_.emplace_back([this](std::stop_token st) {
            while (!st.stop_requested()) {
                Task task;
                {
                    std::unique_lock lock(queue_mutex_);
                    cv_.wait(lock, st, [this] {
                        return !tasks_.empty() || stop_;
                    });

                    if (tasks_.empty()) {
                        // stop_ or stop token, nothing left to run
                        break;
                    }

                    task = std::move(tasks_.front());
                    tasks_.pop();
                }

                if (task.valid()) {
                    task();
                }
            }
        });
    }
}

inline ThreadPool::~ThreadPool() {
    {
        std::lock_guard lock(queue_mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    // jthread автоматически вызовет request_stop и join;
    // оставшиеся задачи будут выполнены до выхода воркеров
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

inline void ThreadPool::wait() {
    std::unique_lock lock(queue_mutex_);
    cv_.wait(lock, [this] {
        return tasks_.empty() && active_tasks_.load(std::memory_order_relaxed) == 0;
    });
}

inline void ThreadPool::wait_for_capacity(std::size_t limit) {
    if (limit == 0) limit = 1;
    std::unique_lock lock(queue_mutex_);
    cv_.wait(lock, [this, limit] {
        return active_tasks_.load(std::memory_order_relaxed) < limit;
    });
}

} // namespace objcp::infra
