/**
 * @file Dispatch.hpp
 * @brief Serial context, worker pool and per-key ordered executor
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 * 
 * Threading model:
 * - SerialQueue: one thread owns the clipboard history; every membership
 *   change and every published state transition runs there.
 * - WorkerPool: compression, blob I/O and decompression.
 * - KeyedExecutor: tasks sharing a key run in submission order, tasks with
 *   different keys run in parallel on the pool.
 */

#pragma once

#ifndef CLIPGUARD_CORE_DISPATCH_HPP
#define CLIPGUARD_CORE_DISPATCH_HPP

#include <ClipGuard/Core/ErrorCodes.hpp>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace ClipGuard::Dispatch {

using Task = std::function<void()>;

// ============================================================================
// SerialQueue
// ============================================================================

/**
 * @brief FIFO task queue drained by a single dedicated thread
 */
class SerialQueue {
public:
    explicit SerialQueue(std::string name = "clipguard.serial");
    ~SerialQueue();
    
    SerialQueue(const SerialQueue&) = delete;
    SerialQueue& operator=(const SerialQueue&) = delete;
    
    /**
     * @brief Enqueue @p task
     * @return false once Shutdown() has begun
     */
    bool post(Task task);
    
    /**
     * @brief Run @p task on the queue and wait for it
     * @return WrongContext when called from the queue itself,
     *         ContextStopped when the queue no longer accepts work
     */
    Result<void> sync(Task task);
    
    /**
     * @brief Block until every task posted so far has run
     * @return WrongContext when called from the queue itself
     */
    Result<void> drain();
    
    /// True on the queue's own thread
    [[nodiscard]] bool isCurrent() const noexcept;
    
    /// Tasks waiting to run
    [[nodiscard]] size_t pending() const;
    
    /// Run what is queued, then stop the thread
    void Shutdown();
    
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    void WorkerLoop();
    
    std::string name_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<Task> tasks_;
    bool running_;
    bool busy_;
    std::atomic<std::thread::id> worker_id_;
    std::thread worker_;
};

// ============================================================================
// WorkerPool
// ============================================================================

/**
 * @brief Fixed-size pool of background threads
 */
class WorkerPool {
public:
    /// @param threads Thread count; 0 picks from hardware_concurrency (2..4)
    explicit WorkerPool(size_t threads = 0);
    ~WorkerPool();
    
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    
    /// @return false once Shutdown() has begun
    bool submit(Task task);
    
    /// Block until the queue is empty and no task is running
    void waitIdle();
    
    void Shutdown();
    
    [[nodiscard]] size_t size() const noexcept { return workers_.size(); }

private:
    void WorkerLoop();
    
    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<Task> tasks_;
    size_t active_;
    bool running_;
    std::vector<std::thread> workers_;
};

// ============================================================================
// KeyedExecutor
// ============================================================================

/**
 * @brief Per-key ordering on top of a WorkerPool
 * 
 * Used for blob writes and deletes: a delete submitted after a save for
 * the same item id never overtakes it.
 */
class KeyedExecutor {
public:
    explicit KeyedExecutor(WorkerPool& pool);
    ~KeyedExecutor();
    
    KeyedExecutor(const KeyedExecutor&) = delete;
    KeyedExecutor& operator=(const KeyedExecutor&) = delete;
    
    /// @return false when the pool rejected the work
    bool submit(const std::string& key, Task task);
    
    /// Block until every submitted task has run
    void waitIdle();
    
    /// Keys with queued or running work
    [[nodiscard]] size_t activeKeys() const;

private:
    void RunLane(const std::string& key);
    
    WorkerPool& pool_;
    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::unordered_map<std::string, std::deque<Task>> lanes_;
    size_t outstanding_;
};

} // namespace ClipGuard::Dispatch

#endif // CLIPGUARD_CORE_DISPATCH_HPP
