/**
 * @file thread_pool.hpp
 * @brief std::jthread-based pool running one execution unit per admitted job.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace kernel_orchestrator {

/**
 * @brief Worker pool with an adjustable target size.
 *
 * Tasks receive the worker's stop_token. shutdown() stops accepting work,
 * runs whatever is already queued, then joins. A bounded shutdown instead
 * drops queued tasks after the grace period and detaches workers still
 * inside a task; queue state is shared with the workers, so a detached
 * worker stays valid after the pool is gone.
 */
class ThreadPool {
public:
    using Task = std::function<void(std::stop_token)>;

    explicit ThreadPool(size_t num_threads = 0, std::string name = "pool");
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Submit a callable for execution.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    /// Fire-and-forget a callable that accepts a stop_token. False after shutdown.
    bool post(Task task);

    /// Start @p count extra workers, e.g. to replace ones stuck in a task.
    void grow(size_t count = 1);

    /// Lower the target size; surplus workers exit once idle.
    void shrink(size_t count = 1);

    /// Drain the queue and join all workers. Idempotent.
    void shutdown();

    /**
     * @brief Stop accepting work and wait up to @p grace for running tasks.
     *        Queued tasks that have not started by then are dropped.
     * @return Number of workers detached while still inside a task.
     */
    size_t shutdown(std::chrono::milliseconds grace);

    /// Block until nothing is queued or running.
    void wait_idle();

    [[nodiscard]] size_t busy_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    struct Shared {
        std::mutex mutex;
        std::condition_variable_any queue_cv;
        std::condition_variable_any idle_cv;
        std::queue<Task> tasks;
        size_t busy{0};
        size_t alive{0};
        size_t target{0};
        bool accepting{true};
    };

    struct WorkerState {               ///< Guarded by Shared::mutex
        bool busy{false};
        bool exited{false};
    };

    struct Worker {
        std::shared_ptr<WorkerState> state;
        std::jthread thread;
    };

    static void worker_loop(const std::shared_ptr<Shared>& shared,
                            const std::shared_ptr<WorkerState>& self,
                            std::stop_token stop);

    void spawn_locked(size_t count);
    size_t stop_workers(std::optional<std::chrono::milliseconds> grace);

    std::string name_;
    std::shared_ptr<Shared> shared_;
    std::vector<Worker> workers_;      ///< Guarded by shared_->mutex
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> ThreadPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    bool queued = post([p = promise, f = std::forward<F>(func)](std::stop_token) mutable {
        try {
            if constexpr (std::is_void_v<ReturnType>) {
                f();
                p->set_value();
            } else {
                p->set_value(f());
            }
        } catch (...) {
            p->set_exception(std::current_exception());
        }
    });

    if (!queued) {
        promise->set_exception(std::make_exception_ptr(
            std::runtime_error("ThreadPool '" + name_ + "' is shut down")));
    }
    return future;
}

}  // namespace kernel_orchestrator
