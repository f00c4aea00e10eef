/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONNECT_STATUS_HPP
#define CONNECT_STATUS_HPP

#include <cstdint>
#include <ostream>

/**
 * @brief Outcome codes for approval, disconnects and session failures
 */
enum class ConnectStatus : uint8_t {
    Undefined = 0,
    Success,
    ServerFull,
    LoggedInAgain,
    UserRequestedDisconnect,
    GenericDisconnect,
    Reconnecting,
    IncompatibleBuildType,
    HostEndedSession,
    StartHostFailed,
    StartClientFailed,
    PayloadTooLarge,
    InvalidPayload,
    ConnectTimeout,
    ReconnectionExhausted
};

enum class ConnectionStateId : uint8_t {
    Offline = 0,
    StartingHost,
    Hosting,
    ClientConnecting,
    ClientConnected,
    ClientReconnecting
};

inline const char* toString(ConnectStatus status) {
    switch (status) {
    case ConnectStatus::Undefined: return "Undefined";
    case ConnectStatus::Success: return "Success";
    case ConnectStatus::ServerFull: return "ServerFull";
    case ConnectStatus::LoggedInAgain: return "LoggedInAgain";
    case ConnectStatus::UserRequestedDisconnect: return "UserRequestedDisconnect";
    case ConnectStatus::GenericDisconnect: return "GenericDisconnect";
    case ConnectStatus::Reconnecting: return "Reconnecting";
    case ConnectStatus::IncompatibleBuildType: return "IncompatibleBuildType";
    case ConnectStatus::HostEndedSession: return "HostEndedSession";
    case ConnectStatus::StartHostFailed: return "StartHostFailed";
    case ConnectStatus::StartClientFailed: return "StartClientFailed";
    case ConnectStatus::PayloadTooLarge: return "PayloadTooLarge";
    case ConnectStatus::InvalidPayload: return "InvalidPayload";
    case ConnectStatus::ConnectTimeout: return "ConnectTimeout";
    case ConnectStatus::ReconnectionExhausted: return "ReconnectionExhausted";
    }
    return "Unknown";
}

/**
 * @brief Human-readable text for status popups on the presentation side
 */
inline const char* describe(ConnectStatus status) {
    switch (status) {
    case ConnectStatus::ServerFull: return "The host is full and cannot accept any additional connections.";
    case ConnectStatus::LoggedInAgain: return "You have logged in elsewhere using the same account.";
    case ConnectStatus::UserRequestedDisconnect: return "You left the session.";
    case ConnectStatus::GenericDisconnect: return "Disconnected from the host.";
    case ConnectStatus::IncompatibleBuildType: return "The host and client builds are not compatible.";
    case ConnectStatus::HostEndedSession: return "The host has ended the game session.";
    case ConnectStatus::StartHostFailed: return "Starting the host failed.";
    case ConnectStatus::StartClientFailed: return "Starting the client failed.";
    case ConnectStatus::PayloadTooLarge: return "The connection request was too large.";
    case ConnectStatus::InvalidPayload: return "The connection request could not be read.";
    case ConnectStatus::ConnectTimeout: return "Timed out while connecting to the host.";
    case ConnectStatus::ReconnectionExhausted: return "Lost connection to the host and could not reconnect.";
    case ConnectStatus::Reconnecting: return "Attempting to reconnect...";
    default: return "";
    }
}

inline const char* toString(ConnectionStateId state) {
    switch (state) {
    case ConnectionStateId::Offline: return "Offline";
    case ConnectionStateId::StartingHost: return "StartingHost";
    case ConnectionStateId::Hosting: return "Hosting";
    case ConnectionStateId::ClientConnecting: return "ClientConnecting";
    case ConnectionStateId::ClientConnected: return "ClientConnected";
    case ConnectionStateId::ClientReconnecting: return "ClientReconnecting";
    }
    return "Unknown";
}

inline std::ostream& operator<<(std::ostream& os, ConnectStatus status) {
    return os << toString(status);
}

inline std::ostream& operator<<(std::ostream& os, ConnectionStateId state) {
    return os << toString(state);
}

#endif // CONNECT_STATUS_HPP
