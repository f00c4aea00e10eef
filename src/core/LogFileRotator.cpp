/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/LogFileRotator.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <vector>

namespace VanguardEngine {

namespace fs = std::filesystem;

LogFileRotator::LogFileRotator(fs::path directory, std::string prefix,
                               std::size_t maxBytes, std::size_t keepCount)
    : m_directory(std::move(directory)),
      m_prefix(std::move(prefix)),
      m_maxBytes(maxBytes),
      m_keepCount(std::max<std::size_t>(keepCount, 1)) {}

bool LogFileRotator::open() {
    std::error_code ec;
    fs::create_directories(m_directory, ec);
    if (ec) {
        return false;
    }
    return openNextFile();
}

void LogFileRotator::writeLine(const std::string& line) {
    if (!m_stream.is_open()) {
        return;
    }
    if (m_maxBytes > 0 && m_bytesWritten >= m_maxBytes) {
        m_stream.close();
        ++m_rotations;
        if (!openNextFile()) {
            return;
        }
    }
    m_stream << line << '\n';
    m_bytesWritten += line.size() + 1;
}

void LogFileRotator::flush() {
    if (m_stream.is_open()) {
        m_stream.flush();
    }
}

bool LogFileRotator::openNextFile() {
    auto timeNow = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm timeinfo{};
#ifdef _WIN32
    localtime_s(&timeinfo, &timeNow);
#else
    localtime_r(&timeNow, &timeinfo);
#endif

    std::ostringstream name;
    name << m_prefix << '_' << std::put_time(&timeinfo, "%Y%m%d_%H%M%S") << '_'
         << std::setfill('0') << std::setw(4) << m_sequence++ << ".log";

    m_currentPath = m_directory / name.str();
    m_stream.open(m_currentPath, std::ios::out | std::ios::trunc);
    m_bytesWritten = 0;
    if (!m_stream.is_open()) {
        return false;
    }
    pruneOldFiles();
    return true;
}

void LogFileRotator::pruneOldFiles() {
    const std::string lead = m_prefix + "_";
    std::vector<fs::path> files;

    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(m_directory, ec)) {
        const std::string filename = entry.path().filename().string();
        if (entry.path().extension() == ".log" && filename.starts_with(lead)) {
            files.push_back(entry.path());
        }
    }
    if (files.size() <= m_keepCount) {
        return;
    }

    std::sort(files.begin(), files.end());
    const std::size_t excess = files.size() - m_keepCount;
    for (std::size_t i = 0; i < excess; ++i) {
        fs::remove(files[i], ec);
    }
}

} // namespace VanguardEngine
