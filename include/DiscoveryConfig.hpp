#pragma once
#ifndef LANBEACON_DISCOVERY_CONFIG_HPP
#define LANBEACON_DISCOVERY_CONFIG_HPP

#include <boost/asio/ip/address_v4.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace lanbeacon {

    // ============================================================
    //  PROTOCOL CONSTANTS
    // ============================================================
    inline constexpr uint16_t DISCOVERY_PORT    = 35891;  // shared with beacon responders
    inline constexpr size_t   LENGTH_FIELD_SIZE = 2;      // big-endian uint16
    inline constexpr size_t   PORT_FIELD_SIZE   = 2;      // big-endian uint16
    inline constexpr size_t   MAX_STRING_BYTES  = 0xFFFF;
    inline constexpr size_t   MAX_DATAGRAM_SIZE = 65507;  // largest UDP payload over IPv4

    inline constexpr std::chrono::milliseconds BROADCAST_INTERVAL{2000};
    inline constexpr std::chrono::seconds      PEER_TIMEOUT{5};

    // ============================================================
    //  PER-ENGINE SETTINGS
    // ============================================================
    struct DiscoveryConfig {
        uint16_t discoveryPort = DISCOVERY_PORT;
        boost::asio::ip::address_v4 bindAddress = boost::asio::ip::address_v4::any();
        boost::asio::ip::address_v4 broadcastAddress = boost::asio::ip::address_v4::broadcast();
        std::chrono::milliseconds broadcastInterval = BROADCAST_INTERVAL;
        std::chrono::milliseconds peerTimeout = PEER_TIMEOUT;
    };

} // namespace lanbeacon

#endif // LANBEACON_DISCOVERY_CONFIG_HPP
