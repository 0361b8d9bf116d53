#pragma once

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>

namespace FxCacheManager {

inline long long getTimestampMs() {
    static auto startTime = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime).count();
}

// Debug output is on unless FXCACHE_QUIET is set (the test suite sets it)
inline bool debugLoggingEnabled() {
    static const bool enabled = std::getenv("FXCACHE_QUIET") == nullptr;
    return enabled;
}

} // namespace FxCacheManager

#define DEBUG_LOG(msg) do { if (::FxCacheManager::debugLoggingEnabled()) { std::cerr << "[" << ::FxCacheManager::getTimestampMs() << "ms] " << msg << std::endl; } } while(0)
#define WARN_LOG(msg) do { std::cerr << "[" << ::FxCacheManager::getTimestampMs() << "ms] WARNING: " << msg << std::endl; } while(0)

namespace FxCacheManager {

// Scoped timer that logs if operation exceeds threshold
class ScopedTimer {
public:
    ScopedTimer(const char* name, int thresholdMs = 50)
        : m_name(name), m_thresholdMs(thresholdMs), m_start(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - m_start).count();
        if (elapsed >= m_thresholdMs) {
            DEBUG_LOG("SLOW: " << m_name << " took " << elapsed << "ms");
        }
    }

    long long elapsedMs() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - m_start).count();
    }

private:
    const char* m_name;
    int m_thresholdMs;
    std::chrono::steady_clock::time_point m_start;
};

} // namespace FxCacheManager

#define SCOPED_TIMER(name) ::FxCacheManager::ScopedTimer _timer_##__LINE__(name)
