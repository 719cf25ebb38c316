/**
 * @file PressureSources.cpp
 * @brief Manual and /proc based pressure sources
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 */

#include <ClipGuard/Core/Pressure.hpp>
#include <atomic>
#include <condition_variable>
#include <fstream>
#include <thread>
#include <unistd.h>

namespace ClipGuard::Resource {

const char* pressureLevelName(PressureLevel level) noexcept {
    switch (level) {
        case PressureLevel::Normal:   return "normal";
        case PressureLevel::Warning:  return "warning";
        case PressureLevel::Critical: return "critical";
    }
    return "unknown";
}

// ============================================================================
// ManualPressureSource
// ============================================================================

Result<void> ManualPressureSource::subscribe(PressureHandler handler) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_handler) {
        return ErrorCode::InvalidState;
    }
    if (!handler) {
        return ErrorCode::InvalidArgument;
    }
    m_handler = std::move(handler);
    return Result<void>::Success();
}

void ManualPressureSource::signal(PressureLevel level) {
    PressureHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        handler = m_handler;
    }
    if (handler) {
        handler(level);
    }
}

// ============================================================================
// ResidentMemoryMonitor Implementation
// ============================================================================

class ResidentMemoryMonitor::Impl {
public:
    Impl(Options options, Core::Logger& logger)
        : m_options(std::move(options))
        , m_logger(logger)
        , m_running(false)
        , m_level(PressureLevel::Normal)
    {
    }

    ~Impl() {
        stop();
    }

    Result<void> subscribe(PressureHandler handler) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_handler) {
            return ErrorCode::InvalidState;
        }
        if (!handler) {
            return ErrorCode::InvalidArgument;
        }
        m_handler = std::move(handler);
        return Result<void>::Success();
    }

    Result<void> start() {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_running) {
            return ErrorCode::InvalidState;
        }

        if (m_options.criticalBytes < m_options.warningBytes ||
            m_options.interval.count() <= 0) {
            return ErrorCode::ConfigInvalid;
        }

        m_running = true;
        m_thread = std::thread(&Impl::pollLoop, this);

        return Result<void>::Success();
    }

    void stop() noexcept {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_running) {
                return;
            }
            m_running = false;
        }

        m_cv.notify_one();

        if (m_thread.joinable()) {
            m_thread.join();
        }
    }

    bool isRunning() const noexcept {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_running;
    }

    PressureLevel currentLevel() const noexcept {
        return m_level.load();
    }

    PressureLevel classify(uint64_t residentBytes) const noexcept {
        if (residentBytes >= m_options.criticalBytes) {
            return PressureLevel::Critical;
        }
        if (residentBytes >= m_options.warningBytes) {
            return PressureLevel::Warning;
        }
        return PressureLevel::Normal;
    }

private:
    void pollLoop() {
        bool reportedReadFailure = false;

        while (true) {
            auto resident = ResidentMemoryMonitor::readResidentBytes(m_options.statmPath);
            if (resident.isSuccess()) {
                reportedReadFailure = false;
                deliver(classify(resident.value()), resident.value());
            } else if (!reportedReadFailure) {
                CLIPGUARD_LOG_WARNING_F(m_logger, "Cannot sample resident memory from %s",
                                        m_options.statmPath.c_str());
                reportedReadFailure = true;
            }

            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait_for(lock, m_options.interval, [this] { return !m_running; });
            if (!m_running) {
                break;
            }
        }
    }

    void deliver(PressureLevel level, uint64_t residentBytes) {
        if (level == m_level.load()) {
            return;
        }
        m_level.store(level);

        CLIPGUARD_LOG_INFO_F(m_logger, "Memory pressure %s (resident %llu bytes)",
                             pressureLevelName(level),
                             static_cast<unsigned long long>(residentBytes));

        PressureHandler handler;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            handler = m_handler;
        }
        if (handler) {
            handler(level);
        }
    }

    Options m_options;
    Core::Logger& m_logger;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::thread m_thread;
    bool m_running;
    std::atomic<PressureLevel> m_level;
    PressureHandler m_handler;
};

// ============================================================================
// ResidentMemoryMonitor Public Interface
// ============================================================================

ResidentMemoryMonitor::ResidentMemoryMonitor(Options options, Core::Logger& logger)
    : m_impl(std::make_unique<Impl>(std::move(options), logger)) {
}

ResidentMemoryMonitor::~ResidentMemoryMonitor() = default;

Result<void> ResidentMemoryMonitor::subscribe(PressureHandler handler) {
    return m_impl->subscribe(std::move(handler));
}

Result<void> ResidentMemoryMonitor::start() {
    return m_impl->start();
}

void ResidentMemoryMonitor::stop() noexcept {
    m_impl->stop();
}

bool ResidentMemoryMonitor::isRunning() const noexcept {
    return m_impl->isRunning();
}

PressureLevel ResidentMemoryMonitor::currentLevel() const noexcept {
    return m_impl->currentLevel();
}

PressureLevel ResidentMemoryMonitor::classify(uint64_t residentBytes) const noexcept {
    return m_impl->classify(residentBytes);
}

Result<uint64_t> ResidentMemoryMonitor::readResidentBytes(const std::string& statmPath) {
    std::ifstream in(statmPath);
    if (!in) {
        return ErrorCode::FileNotFound;
    }

    // statm: size resident shared text lib data dt (pages)
    uint64_t sizePages = 0;
    uint64_t residentPages = 0;
    if (!(in >> sizePages >> residentPages)) {
        return ErrorCode::ParseError;
    }

    long pageSize = ::sysconf(_SC_PAGESIZE);
    if (pageSize <= 0) {
        return ErrorCode::SystemError;
    }

    return residentPages * static_cast<uint64_t>(pageSize);
}

} // namespace ClipGuard::Resource
