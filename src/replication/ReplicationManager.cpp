/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "replication/ReplicationManager.hpp"
#include "core/Logger.hpp"
#include <algorithm>

namespace {
// u64 entity + u8 field + i32 value + u64 version
constexpr size_t RECORD_WIRE_SIZE = 8 + 1 + 4 + 8;
}

void ReplicationManager::record(const ReplicationRecord& record) {
    auto it = std::find_if(m_pending.begin(), m_pending.end(), [&record](const ReplicationRecord& r) {
        return r.entityId == record.entityId && r.field == record.field;
    });
    if (it == m_pending.end()) {
        m_pending.push_back(record);
    } else if (record.version >= it->version) {
        *it = record;
    }
}

size_t ReplicationManager::flush() {
    if (m_pending.empty()) {
        return 0;
    }

    const size_t count = m_pending.size();
    if (m_packetSink) {
        m_packetSink(encode(m_pending));
        ++m_packetsSent;
        REPLICATION_DEBUG("Flushed " + std::to_string(count) + " field updates");
    }
    m_pending.clear();
    return count;
}

BinarySerial::Buffer ReplicationManager::encode(const std::vector<ReplicationRecord>& records) {
    auto writer = BinarySerial::Writer::createBufferWriter();
    writer->write(static_cast<uint32_t>(records.size()));
    for (const auto& r : records) {
        writer->write(static_cast<uint64_t>(r.entityId));
        writer->write(static_cast<uint8_t>(r.field));
        writer->write(r.value);
        writer->write(r.version);
    }
    if (!writer->good()) {
        REPLICATION_ERROR("Failed to encode replication packet");
        return {};
    }
    return writer->takeBuffer();
}

bool ReplicationManager::decode(const BinarySerial::Buffer& packet,
                                std::vector<ReplicationRecord>& out) {
    out.clear();
    auto reader = BinarySerial::Reader::createBufferReader(packet);

    uint32_t count = 0;
    if (!reader->read(count)) {
        REPLICATION_ERROR("Replication packet too short for a header");
        return false;
    }
    if (count > (packet.size() - sizeof(uint32_t)) / RECORD_WIRE_SIZE) {
        REPLICATION_ERROR("Replication packet claims " + std::to_string(count) +
                          " records but holds " + std::to_string(packet.size()) + " bytes");
        return false;
    }

    std::vector<ReplicationRecord> records;
    records.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        uint64_t entityId = 0;
        uint8_t field = 0;
        ReplicationRecord r;
        if (!reader->read(entityId) || !reader->read(field) || !reader->read(r.value) ||
            !reader->read(r.version)) {
            REPLICATION_ERROR("Truncated replication record " + std::to_string(i));
            return false;
        }
        if (field >= static_cast<uint8_t>(ReplicatedField::COUNT)) {
            REPLICATION_ERROR("Unknown replicated field id " + std::to_string(field));
            return false;
        }
        r.entityId = entityId;
        r.field = static_cast<ReplicatedField>(field);
        records.push_back(r);
    }

    out = std::move(records);
    return true;
}
