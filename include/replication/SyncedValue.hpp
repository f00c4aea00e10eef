/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SYNCED_VALUE_HPP
#define SYNCED_VALUE_HPP

#include "core/Logger.hpp"
#include <algorithm>
#include <cassert>
#include <cstdint>
#include <exception>
#include <functional>
#include <ostream>
#include <vector>

enum class SyncResult : uint8_t { Changed = 0, Unchanged, NotAuthorized };

enum class SyncRole : uint8_t { Authority = 0, Observer };

inline std::ostream& operator<<(std::ostream& os, SyncResult result) {
    switch (result) {
    case SyncResult::Changed: return os << "Changed";
    case SyncResult::Unchanged: return os << "Unchanged";
    case SyncResult::NotAuthorized: return os << "NotAuthorized";
    }
    return os << "Unknown";
}

/**
 * @brief A value only the authority may write, observed by everyone
 *
 * The authority mutates through setValue(); observers receive values
 * through applyReplicated(), ordered by the authority's change sequence.
 * Change handlers (old, new) run on both sides after the value is
 * committed. Writing an equal value is a silent no-op.
 *
 * A setValue() on an observer is a programming error: it is logged as
 * CRITICAL and trips an assert in debug builds unless
 * VANGUARD_NO_AUTHORITY_ASSERT is defined (builds with tests enabled define
 * it to check the NotAuthorized result).
 */
template <typename T>
class SyncedValue {
public:
    using ChangeHandler = std::function<void(const T& oldValue, const T& newValue)>;
    using HandlerId = uint32_t;

    explicit SyncedValue(T initial = T{}, SyncRole role = SyncRole::Authority)
        : m_value(initial), m_role(role) {}

    // Handlers capture context tied to the owner, so copies start without them
    SyncedValue(const SyncedValue& other)
        : m_value(other.m_value), m_role(other.m_role), m_sequence(other.m_sequence) {}

    SyncedValue& operator=(const SyncedValue& other) {
        m_value = other.m_value;
        m_role = other.m_role;
        m_sequence = other.m_sequence;
        return *this;
    }

    const T& get() const { return m_value; }
    uint64_t getSequence() const { return m_sequence; }
    SyncRole getRole() const { return m_role; }
    bool isAuthority() const { return m_role == SyncRole::Authority; }
    void setRole(SyncRole role) { m_role = role; }

    SyncResult setValue(const T& newValue) {
        if (m_role != SyncRole::Authority) {
            REPLICATION_CRITICAL("setValue called on a non-authoritative synced value");
#if defined(DEBUG) && !defined(VANGUARD_NO_AUTHORITY_ASSERT)
            assert(false && "SyncedValue::setValue requires authority");
#endif
            return SyncResult::NotAuthorized;
        }
        if (newValue == m_value) {
            return SyncResult::Unchanged;
        }
        commit(newValue);
        ++m_sequence;
        notify();
        return SyncResult::Changed;
    }

    /**
     * @brief Observer side: apply a value received from the authority
     * @return true if applied; stale or duplicate sequences are ignored
     */
    bool applyReplicated(const T& value, uint64_t sequence) {
        if (sequence <= m_sequence) {
            return false;
        }
        m_sequence = sequence;
        if (value == m_value) {
            return true;
        }
        commit(value);
        notify();
        return true;
    }

    HandlerId addChangeHandler(ChangeHandler handler) {
        HandlerId id = m_nextHandlerId++;
        m_handlers.push_back({id, std::move(handler)});
        return id;
    }

    bool removeChangeHandler(HandlerId id) {
        auto it = std::find_if(m_handlers.begin(), m_handlers.end(),
                               [id](const Entry& e) { return e.id == id; });
        if (it == m_handlers.end()) {
            return false;
        }
        m_handlers.erase(it);
        return true;
    }

    size_t getChangeHandlerCount() const { return m_handlers.size(); }

private:
    struct Entry {
        HandlerId id;
        ChangeHandler handler;
    };

    T m_value;
    T m_previous{};
    SyncRole m_role;
    uint64_t m_sequence{0};
    std::vector<Entry> m_handlers;
    HandlerId m_nextHandlerId{1};

    void commit(const T& value) {
        m_previous = m_value;
        m_value = value;
    }

    void notify() {
        // Copy so a handler may add or remove handlers safely
        const std::vector<Entry> handlers = m_handlers;
        const T oldValue = m_previous;
        const T newValue = m_value;
        for (const auto& entry : handlers) {
            try {
                entry.handler(oldValue, newValue);
            } catch (const std::exception& e) {
                REPLICATION_ERROR("Synced value change handler threw: " + std::string(e.what()));
            }
        }
    }
};

#endif // SYNCED_VALUE_HPP
