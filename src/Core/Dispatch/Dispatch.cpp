/**
 * @file Dispatch.cpp
 * @brief SerialQueue, WorkerPool and KeyedExecutor
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 */

#include <ClipGuard/Core/Dispatch.hpp>
#include <algorithm>
#include <future>

namespace ClipGuard::Dispatch {

// ============================================================================
// SerialQueue
// ============================================================================

SerialQueue::SerialQueue(std::string name)
    : name_(std::move(name))
    , running_(true)
    , busy_(false)
    , worker_id_(std::thread::id()) {
    worker_ = std::thread(&SerialQueue::WorkerLoop, this);
}

SerialQueue::~SerialQueue() {
    Shutdown();
}

bool SerialQueue::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

Result<void> SerialQueue::sync(Task task) {
    if (isCurrent()) {
        return ErrorCode::WrongContext;
    }
    
    std::promise<void> done;
    auto future = done.get_future();
    bool accepted = post([&task, &done]() {
        task();
        done.set_value();
    });
    if (!accepted) {
        return ErrorCode::ContextStopped;
    }
    
    future.wait();
    return Result<void>::Success();
}

Result<void> SerialQueue::drain() {
    if (isCurrent()) {
        return ErrorCode::WrongContext;
    }
    
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this]() { return tasks_.empty() && !busy_; });
    return Result<void>::Success();
}

bool SerialQueue::isCurrent() const noexcept {
    return worker_id_.load() == std::this_thread::get_id();
}

size_t SerialQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void SerialQueue::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    cv_.notify_all();
    
    if (worker_.joinable() && !isCurrent()) {
        worker_.join();
    }
}

void SerialQueue::WorkerLoop() {
    worker_id_.store(std::this_thread::get_id());
    
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        cv_.wait(lock, [this]() { return !tasks_.empty() || !running_; });
        
        // Drain what was accepted before stopping
        if (tasks_.empty()) {
            break;
        }
        
        Task task = std::move(tasks_.front());
        tasks_.pop_front();
        busy_ = true;
        lock.unlock();
        
        task();
        
        lock.lock();
        busy_ = false;
        if (tasks_.empty()) {
            idle_cv_.notify_all();
        }
    }
    idle_cv_.notify_all();
}

// ============================================================================
// WorkerPool
// ============================================================================

WorkerPool::WorkerPool(size_t threads)
    : active_(0)
    , running_(true) {
    if (threads == 0) {
        threads = std::clamp<size_t>(std::thread::hardware_concurrency(), 2, 4);
    }
    
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back(&WorkerPool::WorkerLoop, this);
    }
}

WorkerPool::~WorkerPool() {
    Shutdown();
}

bool WorkerPool::submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void WorkerPool::waitIdle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this]() { return tasks_.empty() && active_ == 0; });
}

void WorkerPool::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    cv_.notify_all();
    
    for (auto& worker : workers_) {
        if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
            worker.join();
        }
    }
}

void WorkerPool::WorkerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        cv_.wait(lock, [this]() { return !tasks_.empty() || !running_; });
        
        if (tasks_.empty()) {
            break;
        }
        
        Task task = std::move(tasks_.front());
        tasks_.pop_front();
        ++active_;
        lock.unlock();
        
        task();
        
        lock.lock();
        --active_;
        if (tasks_.empty() && active_ == 0) {
            idle_cv_.notify_all();
        }
    }
}

// ============================================================================
// KeyedExecutor
// ============================================================================

KeyedExecutor::KeyedExecutor(WorkerPool& pool)
    : pool_(pool)
    , outstanding_(0) {
}

KeyedExecutor::~KeyedExecutor() {
    waitIdle();
}

bool KeyedExecutor::submit(const std::string& key, Task task) {
    bool startLane = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& lane = lanes_[key];
        startLane = lane.empty();
        lane.push_back(std::move(task));
        ++outstanding_;
    }
    
    if (startLane && !pool_.submit([this, key]() { RunLane(key); })) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = lanes_.find(key);
        if (it != lanes_.end()) {
            outstanding_ -= it->second.size();
            lanes_.erase(it);
        }
        idle_cv_.notify_all();
        return false;
    }
    return true;
}

void KeyedExecutor::RunLane(const std::string& key) {
    Task task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = lanes_.find(key);
        if (it == lanes_.end() || it->second.empty()) {
            return;
        }
        task = std::move(it->second.front());
    }
    
    task();
    
    bool more = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = lanes_.find(key);
        it->second.pop_front();
        --outstanding_;
        if (it->second.empty()) {
            lanes_.erase(it);
        } else {
            more = true;
        }
        if (outstanding_ == 0) {
            idle_cv_.notify_all();
        }
    }
    
    // The front entry stays queued while it runs, so a concurrent submit
    // for the same key sees a non-empty lane and does not start a second runner
    if (more && !pool_.submit([this, key]() { RunLane(key); })) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = lanes_.find(key);
        if (it != lanes_.end()) {
            outstanding_ -= it->second.size();
            lanes_.erase(it);
        }
        idle_cv_.notify_all();
    }
}

void KeyedExecutor::waitIdle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this]() { return outstanding_ == 0; });
}

size_t KeyedExecutor::activeKeys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lanes_.size();
}

} // namespace ClipGuard::Dispatch
