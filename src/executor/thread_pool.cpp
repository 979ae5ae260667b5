/**
 * @file thread_pool.cpp
 * @brief ThreadPool implementation.
 */

#include "executor/thread_pool.hpp"

#include <algorithm>
#include <iterator>

namespace kernel_orchestrator {

ThreadPool::ThreadPool(size_t num_threads, std::string name)
    : name_(std::move(name))
    , shared_(std::make_shared<Shared>()) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;  // fallback
    }

    std::lock_guard lock(shared_->mutex);
    shared_->target = num_threads;
    workers_.reserve(num_threads);
    spawn_locked(num_threads);
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::spawn_locked(size_t count) {
    for (size_t i = 0; i < count; ++i) {
        auto state = std::make_shared<WorkerState>();
        ++shared_->alive;
        workers_.push_back(Worker{
            .state = state,
            .thread = std::jthread([shared = shared_, state](std::stop_token stop) {
                worker_loop(shared, state, stop);
            })
        });
    }
}

bool ThreadPool::post(Task task) {
    {
        std::lock_guard lock(shared_->mutex);
        if (!shared_->accepting) return false;
        shared_->tasks.push(std::move(task));
    }
    shared_->queue_cv.notify_one();
    return true;
}

void ThreadPool::grow(size_t count) {
    std::vector<Worker> finished;
    {
        std::lock_guard lock(shared_->mutex);
        if (!shared_->accepting) return;

        // Reap workers that left after an earlier shrink()
        auto split = std::stable_partition(workers_.begin(), workers_.end(),
                                           [](const Worker& w) { return !w.state->exited; });
        std::move(split, workers_.end(), std::back_inserter(finished));
        workers_.erase(split, workers_.end());

        shared_->target += count;
        spawn_locked(count);
    }
    for (auto& worker : finished) {
        if (worker.thread.joinable()) worker.thread.join();
    }
}

void ThreadPool::shrink(size_t count) {
    {
        std::lock_guard lock(shared_->mutex);
        shared_->target -= std::min(count, shared_->target);
    }
    shared_->queue_cv.notify_all();
}

void ThreadPool::shutdown() {
    stop_workers(std::nullopt);
}

size_t ThreadPool::shutdown(std::chrono::milliseconds grace) {
    return stop_workers(grace);
}

size_t ThreadPool::stop_workers(std::optional<std::chrono::milliseconds> grace) {
    std::vector<Worker> to_join;
    std::vector<Worker> to_detach;
    std::queue<Task> dropped;
    {
        std::unique_lock lock(shared_->mutex);
        if (!shared_->accepting && workers_.empty()) return 0;
        shared_->accepting = false;
        shared_->queue_cv.notify_all();

        if (grace) {
            shared_->idle_cv.wait_for(lock, *grace, [this] {
                return shared_->tasks.empty() && shared_->busy == 0;
            });
            dropped.swap(shared_->tasks);
            for (auto& worker : workers_) {
                (worker.state->busy ? to_detach : to_join).push_back(std::move(worker));
            }
        } else {
            to_join = std::move(workers_);
        }
        workers_.clear();
    }
    shared_->queue_cv.notify_all();

    // Workers exit once the queue is empty and accepting is false
    for (auto& worker : to_join) {
        if (worker.thread.joinable()) worker.thread.join();
    }
    for (auto& worker : to_detach) {
        worker.thread.detach();
    }
    return to_detach.size();
}

void ThreadPool::wait_idle() {
    std::unique_lock lock(shared_->mutex);
    shared_->idle_cv.wait(lock, [this] { return shared_->tasks.empty() && shared_->busy == 0; });
}

void ThreadPool::worker_loop(const std::shared_ptr<Shared>& shared,
                             const std::shared_ptr<WorkerState>& self,
                             std::stop_token stop) {
    while (true) {
        Task task;
        {
            std::unique_lock lock(shared->mutex);
            shared->queue_cv.wait(lock, [&] {
                return !shared->tasks.empty() || !shared->accepting || shared->alive > shared->target;
            });

            // Shut down and drained, or surplus after shrink()
            if (shared->tasks.empty()) {
                --shared->alive;
                self->exited = true;
                return;
            }

            task = std::move(shared->tasks.front());
            shared->tasks.pop();
            ++shared->busy;
            self->busy = true;
        }

        task(stop);

        {
            std::lock_guard lock(shared->mutex);
            --shared->busy;
            self->busy = false;
        }
        shared->idle_cv.notify_all();
    }
}

size_t ThreadPool::busy_count() const noexcept {
    std::lock_guard lock(shared_->mutex);
    return shared_->busy;
}

size_t ThreadPool::queued_count() const noexcept {
    std::lock_guard lock(shared_->mutex);
    return shared_->tasks.size();
}

size_t ThreadPool::thread_count() const noexcept {
    std::lock_guard lock(shared_->mutex);
    return shared_->alive;
}

}  // namespace kernel_orchestrator
