/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONNECTION_PAYLOAD_HPP
#define CONNECTION_PAYLOAD_HPP

#include <optional>
#include <string>

/**
 * @brief What a client sends with its connection request
 *
 * Wire form is JSON text:
 * @code
 * {"playerId":"b6c1...","playerName":"Ayla","isDebug":false}
 * @endcode
 */
struct ConnectionPayload {
    std::string playerId;   // Stable across reconnects
    std::string playerName;
    bool isDebug{false};

    std::string toJson() const;

    // nullopt if the text is not JSON or playerId is missing or empty
    static std::optional<ConnectionPayload> fromJson(const std::string& json);
};

#endif // CONNECTION_PAYLOAD_HPP
