/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef REPLICATION_MANAGER_HPP
#define REPLICATION_MANAGER_HPP

/**
 * @file ReplicationManager.hpp
 * @brief Authority side of the replication channel
 *
 * Collects synced-field writes during a tick and flushes them once, at the
 * end of the tick, as a single packet:
 * @code
 * [u32 count] count x [u64 entityId][u8 field][i32 value][u64 version]
 * @endcode
 * Writes to the same (entity, field) within one tick collapse to the latest.
 */

#include "replication/ReplicationTypes.hpp"
#include "utils/BinarySerializer.hpp"
#include <cstdint>
#include <functional>
#include <vector>

class ReplicationManager {
public:
    using PacketSink = std::function<void(const BinarySerial::Buffer& packet)>;

    ReplicationManager() = default;

    ReplicationManager(const ReplicationManager&) = delete;
    ReplicationManager& operator=(const ReplicationManager&) = delete;

    void record(const ReplicationRecord& record);

    /**
     * @brief Encodes pending records and hands the packet to the sink
     * @return Number of records sent (0 when nothing was pending)
     */
    size_t flush();

    void setPacketSink(PacketSink sink) { m_packetSink = std::move(sink); }

    size_t getPendingCount() const { return m_pending.size(); }
    uint64_t getPacketsSent() const { return m_packetsSent; }
    void clearPending() { m_pending.clear(); }

    static BinarySerial::Buffer encode(const std::vector<ReplicationRecord>& records);

    /**
     * @brief Decodes a whole packet
     * @return false on truncated or malformed input; out is left empty then
     */
    static bool decode(const BinarySerial::Buffer& packet, std::vector<ReplicationRecord>& out);

private:
    std::vector<ReplicationRecord> m_pending;
    PacketSink m_packetSink;
    uint64_t m_packetsSent{0};
};

#endif // REPLICATION_MANAGER_HPP
