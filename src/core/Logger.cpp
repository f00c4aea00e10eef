/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Only compile this file for release builds - debug builds log to the console
#ifndef DEBUG

#include "core/Logger.hpp"
#include "core/LogFileRotator.hpp"

#include <SDL3/SDL.h>

#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>

#ifndef VANGUARD_APP_NAME
#define VANGUARD_APP_NAME "VanguardServer"
#endif

namespace VanguardEngine {
namespace {

constexpr std::size_t LOG_FILE_MAX_BYTES = 4 * 1024 * 1024;
constexpr std::size_t LOG_FILES_KEPT = 10;
constexpr std::size_t FLUSH_EVERY = 20;

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto timeNow = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) % 1000;
    std::tm timeinfo{};
#ifdef _WIN32
    localtime_s(&timeinfo, &timeNow);
#else
    localtime_r(&timeNow, &timeinfo);
#endif
    std::ostringstream out;
    out << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << ms.count();
    return out.str();
}

// Dedicated servers run unattended for days, so release logs go to
// size-capped files under the SDL pref path
class ServerLogSink {
public:
    static ServerLogSink& Instance() {
        static ServerLogSink instance;
        return instance;
    }

    void write(const char* level, const char* system, const char* message) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_opened) {
            open();
        }
        if (!m_rotator || !m_rotator->isOpen()) {
            return;
        }

        m_rotator->writeLine(timestamp() + " [" + level + "] [" + system + "] " + message);
        if (std::strcmp(level, "CRITICAL") == 0 || ++m_pending >= FLUSH_EVERY) {
            m_rotator->flush();
            m_pending = 0;
        }
    }

private:
    ServerLogSink() = default;
    ~ServerLogSink() {
        if (m_rotator) {
            m_rotator->flush();
        }
    }

    ServerLogSink(const ServerLogSink&) = delete;
    ServerLogSink& operator=(const ServerLogSink&) = delete;

    void open() {
        m_opened = true;

        char* prefPath = SDL_GetPrefPath("Vanguard", VANGUARD_APP_NAME);
        if (prefPath == nullptr) {
            return; // No writable location, file logging stays off
        }
        std::filesystem::path logDir = std::filesystem::path(prefPath) / "logs";
        SDL_free(prefPath);

        m_rotator = std::make_unique<LogFileRotator>(logDir, "server", LOG_FILE_MAX_BYTES,
                                                     LOG_FILES_KEPT);
        if (!m_rotator->open()) {
            m_rotator.reset();
            return;
        }
        m_rotator->writeLine(std::string("=== ") + VANGUARD_APP_NAME + " started " +
                             timestamp() + " ===");
        m_rotator->flush();
    }

    std::mutex m_mutex;
    std::unique_ptr<LogFileRotator> m_rotator;
    bool m_opened{false};
    std::size_t m_pending{0};
};

} // anonymous namespace

void Logger::Log(const char* level, const char* system,
                 const std::string& message) {
    Log(level, system, message.c_str());
}

void Logger::Log(const char* level, const char* system, const char* message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
        return;
    }
    ServerLogSink::Instance().write(level, system, message);
}

} // namespace VanguardEngine

#endif // ifndef DEBUG
