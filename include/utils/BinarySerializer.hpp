/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BINARY_SERIALIZER_HPP
#define BINARY_SERIALIZER_HPP

#include "core/Logger.hpp"
#include <cstdint>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

/**
 * Header-only binary serialization over shared streams.
 * Used for the replication channel, where packets are built in memory and
 * handed to the transport as byte buffers.
 */
namespace BinarySerial {

using Buffer = std::vector<uint8_t>;

class Writer {
private:
  std::shared_ptr<std::ostream> m_stream;

public:
  explicit Writer(std::shared_ptr<std::ostream> stream) : m_stream(stream) {
    if (!stream || !stream->good()) {
      throw std::runtime_error("Invalid output stream");
    }
  }

  ~Writer() {
    if (m_stream) {
      m_stream->flush();
    }
  }

  // Writer over an in-memory stream; pair with takeBuffer()
  static std::unique_ptr<Writer> createBufferWriter() {
    auto stream = std::make_shared<std::ostringstream>(std::ios::binary);
    return std::make_unique<Writer>(stream);
  }

  template <typename T> bool write(const T &value) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    m_stream->write(reinterpret_cast<const char *>(&value), sizeof(T));
    return m_stream->good();
  }

  bool writeString(const std::string &str) {
    uint32_t length = static_cast<uint32_t>(str.length());
    if (!write(length)) {
      return false;
    }
    if (length > 0) {
      m_stream->write(str.c_str(), length);
    }
    return m_stream->good();
  }

  bool good() const { return m_stream && m_stream->good(); }

  /**
   * @brief Copies out everything written so far
   * @return Bytes written, or an empty buffer for non-memory streams
   */
  Buffer takeBuffer() const {
    auto *memory = dynamic_cast<std::ostringstream *>(m_stream.get());
    if (!memory) {
      REPLICATION_ERROR("takeBuffer called on a non-memory writer");
      return {};
    }
    const std::string bytes = memory->str();
    return Buffer(bytes.begin(), bytes.end());
  }
};

class Reader {
private:
  std::shared_ptr<std::istream> m_stream;

public:
  explicit Reader(std::shared_ptr<std::istream> stream) : m_stream(stream) {
    if (!stream || !stream->good()) {
      throw std::runtime_error("Invalid input stream");
    }
  }

  static std::unique_ptr<Reader> createBufferReader(const Buffer &buffer) {
    auto stream = std::make_shared<std::istringstream>(
        std::string(buffer.begin(), buffer.end()), std::ios::binary);
    return std::make_unique<Reader>(stream);
  }

  template <typename T> bool read(T &value) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    m_stream->read(reinterpret_cast<char *>(&value), sizeof(T));
    return m_stream->good() && m_stream->gcount() == sizeof(T);
  }

  bool readString(std::string &str) {
    uint32_t length = 0;
    if (!read(length)) {
      return false;
    }

    if (length == 0) {
      str.clear();
      return true;
    }

    if (length > 1024 * 1024) { // 1MB limit
      REPLICATION_ERROR("String length too large: " + std::to_string(length) +
                        " bytes");
      return false;
    }

    str.resize(length);
    m_stream->read(&str[0], length);
    return m_stream->good() &&
           m_stream->gcount() == static_cast<std::streamsize>(length);
  }

  bool good() const { return m_stream && m_stream->good(); }
};

} // namespace BinarySerial

#endif // BINARY_SERIALIZER_HPP
