#pragma once
#ifndef LANBEACON_PEER_RECORD_HPP
#define LANBEACON_PEER_RECORD_HPP

#include <boost/asio/ip/udp.hpp>
#include <chrono>
#include <ostream>
#include <string>
#include <vector>

namespace lanbeacon {

    using udp = boost::asio::ip::udp;
    using Clock = std::chrono::steady_clock;

    /**
     * One discovered beacon. Immutable: a newer reply from the same address
     * produces a new record that replaces this one.
     */
    class PeerRecord {
        public:
            PeerRecord(udp::endpoint address, std::string payload, Clock::time_point lastSeen);

            /**
             * Endpoint the beacon advertised: the sender's host with the port
             * carried in the reply, not the datagram's source port.
             */
            const udp::endpoint& address() const { return address_; }

            const std::string& payload() const { return payload_; }

            Clock::time_point lastSeen() const { return lastSeen_; }

            /** "payload@host:port", for logs and the demo output. */
            std::string toString() const;

            // Identity is the address alone.
            bool operator==(const PeerRecord& other) const { return address_ == other.address_; }
            bool operator!=(const PeerRecord& other) const { return !(*this == other); }

        private:
            udp::endpoint address_;
            std::string payload_;
            Clock::time_point lastSeen_;
    };

    std::ostream& operator<<(std::ostream& os, const PeerRecord& record);

    // ============================================================
    //  ORDERING
    // ============================================================

    /**
     * Total order over endpoints: ordinal compare of the textual host, then
     * descending port on a host tie. Returns <0, 0 or >0.
     */
    int compareAddress(const udp::endpoint& a, const udp::endpoint& b);

    struct AddressLess {
        bool operator()(const udp::endpoint& a, const udp::endpoint& b) const {
            return compareAddress(a, b) < 0;
        }
    };

    /** Payload ascending, then compareAddress. */
    bool canonicalLess(const PeerRecord& a, const PeerRecord& b);

    void sortCanonical(std::vector<PeerRecord>& records);

    /**
     * Snapshot comparison: same length and, position by position, same
     * address and same payload. lastSeen is not compared.
     */
    bool samePeers(const std::vector<PeerRecord>& a, const std::vector<PeerRecord>& b);

} // namespace lanbeacon

#endif // LANBEACON_PEER_RECORD_HPP
