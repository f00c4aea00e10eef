/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "connection/ConnectionPayload.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"

using VanguardEngine::JsonObject;
using VanguardEngine::JsonReader;
using VanguardEngine::JsonValue;

std::string ConnectionPayload::toJson() const {
    JsonObject object;
    object["playerId"] = JsonValue(playerId);
    object["playerName"] = JsonValue(playerName);
    object["isDebug"] = JsonValue(isDebug);
    return JsonValue(std::move(object)).toString();
}

std::optional<ConnectionPayload> ConnectionPayload::fromJson(const std::string& json) {
    JsonReader reader;
    if (!reader.parse(json)) {
        CONNECTION_DEBUG("Unreadable connection payload: " + reader.getLastError());
        return std::nullopt;
    }

    const JsonValue& root = reader.getRoot();
    if (!root.isObject()) {
        return std::nullopt;
    }

    ConnectionPayload payload;
    payload.playerId = root.getString("playerId", "");
    payload.playerName = root.getString("playerName", "");
    payload.isDebug = root.getBool("isDebug", false);
    if (payload.playerId.empty()) {
        return std::nullopt;
    }
    return payload;
}
