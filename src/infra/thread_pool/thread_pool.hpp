#pragma once

#include <chrono>
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
#include <type_traits>

namespace fsort::infra {

/// Пул из N рабочих потоков с общей FIFO-очередью.
///
/// Отмена кооперативная: request_stop() не выбрасывает задачи из очереди,
/// задачи сами проверяют stop_token() и завершаются сразу, если он взведён.
/// Так каждая отправленная задача выполняется ровно один раз.
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

    // Ожидание с ограничением по времени. true, если все задачи завершены.
    template<typename Rep, typename Period>
    [[nodiscard]] auto wait_for(const std::chrono::duration<Rep, Period>& timeout) -> bool;

    // Запрос кооперативной отмены ещё не начатых задач
    void request_stop() noexcept { cancel_.request_stop(); }

    [[nodiscard]] auto stop_token() const noexcept -> std::stop_token { return cancel_.get_token(); }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return workers_.size(); }

    // Поставлено, но ещё не завершено (в очереди + выполняются)
    [[nodiscard]] auto pending() const -> std::size_t;

private:
    using Task = std::packaged_task<void()>;

    void worker_loop_(std::stop_token st);
    void push_(Task task);

    std::vector<std::jthread> workers_;
    std::queue<Task> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any cv_;
    std::condition_variable done_cv_;
    bool stop_ = false;
    std::size_t pending_ = 0;
    std::stop_source cancel_;
};

// =============== Реализация шаблонов ===============

template<typename F, typename... Args>
void ThreadPool::enqueue(F&& f, Args&&... args) {
    // future не нужен: задача сама сообщает результат
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
    push_(Task([task]() { (*task)(); }));
    return future;
}

template<typename Rep, typename Period>
auto ThreadPool::wait_for(const std::chrono::duration<Rep, Period>& timeout) -> bool {
    std::unique_lock lock(queue_mutex_);
    return done_cv_.wait_for(lock, timeout, [this] { return pending_ == 0; });
}

// =============== Реализация ===============

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
    cv_.notify_all();
    // join до разрушения очереди и мьютекса
    workers_.clear();
}

inline void ThreadPool::push_(Task task) {
    {
        std::lock_guard lock(queue_mutex_);
        if (stop_) {
            throw std::runtime_error("ThreadPool is stopped");
        }
        ++pending_;
        tasks_.push(std::move(task));
    }
    cv_.notify_one();
}

inline void ThreadPool::worker_loop_(std::stop_token st) {
    for (;;) {
        Task task;
        {
            std::unique_lock lock(queue_mutex_);
            cv_.wait(lock, st, [this] { return stop_ || !tasks_.empty(); });

            // При остановке очередь дорабатывается до конца
            if (tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }

        task();

        {
            std::lock_guard lock(queue_mutex_);
            --pending_;
        }
        done_cv_.notify_all();
    }
}

inline void ThreadPool::wait() {
    std::unique_lock lock(queue_mutex_);
    done_cv_.wait(lock, [this] { return pending_ == 0; });
}

inline auto ThreadPool::pending() const -> std::size_t {
    std::lock_guard lock(queue_mutex_);
    return pending_;
}

} // namespace fsort::infra
