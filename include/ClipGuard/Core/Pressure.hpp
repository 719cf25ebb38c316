/**
 * @file Pressure.hpp
 * @brief Memory-pressure levels and the sources that raise them
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 */

#pragma once

#ifndef CLIPGUARD_CORE_PRESSURE_HPP
#define CLIPGUARD_CORE_PRESSURE_HPP

#include <ClipGuard/Core/Types.hpp>
#include <ClipGuard/Core/ErrorCodes.hpp>
#include <ClipGuard/Core/Logger.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace ClipGuard::Resource {

enum class PressureLevel : uint8_t {
    Normal = 0,
    Warning = 1,
    Critical = 2
};

const char* pressureLevelName(PressureLevel level) noexcept;

/// Invoked on the source's own thread
using PressureHandler = std::function<void(PressureLevel)>;

/**
 * @brief Delivers pressure levels to a single subscriber
 */
class IPressureSource {
public:
    virtual ~IPressureSource() = default;

    /**
     * @brief Register the one handler for the source's lifetime
     * @return InvalidState when a handler is already registered
     */
    virtual Result<void> subscribe(PressureHandler handler) = 0;
};

/**
 * @brief Source driven by explicit calls (host OS hooks, tests)
 */
class ManualPressureSource : public IPressureSource {
public:
    Result<void> subscribe(PressureHandler handler) override;

    /// Deliver @p level synchronously to the subscriber
    void signal(PressureLevel level);

private:
    std::mutex m_mutex;
    PressureHandler m_handler;
};

/**
 * @brief Polls resident set size and reports level changes
 *
 * Reads `/proc/self/statm` every interval. A level is delivered only when
 * it differs from the last one delivered; the first sample is delivered
 * only when it is not Normal.
 */
class ResidentMemoryMonitor : public IPressureSource {
public:
    struct Options {
        uint64_t warningBytes = 512ULL * 1024 * 1024;
        uint64_t criticalBytes = 1024ULL * 1024 * 1024;
        Milliseconds interval{2000};
        std::string statmPath = "/proc/self/statm";
    };

    ResidentMemoryMonitor(Options options, Core::Logger& logger);
    ~ResidentMemoryMonitor() override;

    ResidentMemoryMonitor(const ResidentMemoryMonitor&) = delete;
    ResidentMemoryMonitor& operator=(const ResidentMemoryMonitor&) = delete;

    Result<void> subscribe(PressureHandler handler) override;

    /**
     * @brief Start the polling thread
     * @return InvalidState if running, ConfigInvalid for bad thresholds
     */
    Result<void> start();

    void stop() noexcept;

    [[nodiscard]] bool isRunning() const noexcept;

    /// Last level delivered (Normal before any change)
    [[nodiscard]] PressureLevel currentLevel() const noexcept;

    /// Map a resident size onto a level
    [[nodiscard]] PressureLevel classify(uint64_t residentBytes) const noexcept;

    /// Resident bytes from a statm file (second field times page size)
    static Result<uint64_t> readResidentBytes(const std::string& statmPath);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace ClipGuard::Resource

#endif // CLIPGUARD_CORE_PRESSURE_HPP
