/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef LOG_FILE_ROTATOR_HPP
#define LOG_FILE_ROTATOR_HPP

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>

namespace VanguardEngine {

/**
 * @brief Size-capped log files for a long-running server
 *
 * Files are named <prefix>_<YYYYmmdd_HHMMSS>_<seq>.log so that name order is
 * creation order. When the current file passes maxBytes the next write goes
 * to a fresh file, and only the newest keepCount files are kept on disk.
 * Not thread-safe; the caller serializes writes.
 */
class LogFileRotator {
public:
    LogFileRotator(std::filesystem::path directory, std::string prefix,
                   std::size_t maxBytes, std::size_t keepCount);

    LogFileRotator(const LogFileRotator&) = delete;
    LogFileRotator& operator=(const LogFileRotator&) = delete;

    // Creates the directory and the first file; false if either fails
    bool open();

    // Appends one line, rolling to a new file first when the cap was reached
    void writeLine(const std::string& line);

    void flush();

    bool isOpen() const { return m_stream.is_open(); }
    const std::filesystem::path& getCurrentPath() const { return m_currentPath; }
    std::size_t getRotationCount() const { return m_rotations; }

private:
    bool openNextFile();
    void pruneOldFiles();

    std::filesystem::path m_directory;
    std::string m_prefix;
    std::size_t m_maxBytes;
    std::size_t m_keepCount;

    std::ofstream m_stream;
    std::filesystem::path m_currentPath;
    std::size_t m_bytesWritten{0};
    std::size_t m_sequence{0};
    std::size_t m_rotations{0};
};

} // namespace VanguardEngine

#endif // LOG_FILE_ROTATOR_HPP
