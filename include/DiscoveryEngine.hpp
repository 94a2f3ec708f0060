#pragma once
#ifndef LANBEACON_DISCOVERY_ENGINE_HPP
#define LANBEACON_DISCOVERY_ENGINE_HPP

#include "DiscoveryConfig.hpp"
#include "PeerRecord.hpp"
#include "PeerTable.hpp"
#include <boost/asio.hpp>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace lanbeacon {

    /**
     * Probe side of beacon discovery.
     *
     * Broadcasts a probe for `beaconType` every broadcastInterval, collects
     * the replies arriving on the same socket and keeps a PeerTable of the
     * beacons heard from within peerTimeout.
     *
     * Two threads run while started: the io thread (Asio io_context, which
     * runs the receive handler and every socket operation) and the control
     * thread (broadcast, wait, prune). Peer listeners are called on whichever
     * of the two made the change, see PeerTable.
     */
    class DiscoveryEngine {
        public:
            using PeersCallback = PeerTable::PeersCallback;

            /**
             * Throws std::length_error if `beaconType` cannot be encoded.
             */
            explicit DiscoveryEngine(std::string beaconType, DiscoveryConfig config = DiscoveryConfig{});
            ~DiscoveryEngine();

            DiscoveryEngine(const DiscoveryEngine&) = delete;
            DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

            /**
             * Binds the socket, arms reception and starts both threads.
             * Socket failures are thrown as boost::system::system_error and
             * leave the engine unstarted. Throws std::logic_error after stop().
             */
            void start();

            /**
             * Wakes and joins the control thread, then closes the socket and
             * joins the io thread. Safe to call more than once; must not be
             * called from a peer listener.
             */
            void stop();

            /**
             * Subscribes to peer-set changes. Register before start() to see
             * the first snapshot.
             */
            void onPeersChanged(PeersCallback cb);

            std::vector<PeerRecord> currentPeers() const;

            /**
             * Bound local endpoint, or a default endpoint when not running.
             */
            udp::endpoint localEndpoint() const;

            const std::string& beaconType() const { return type; }

            bool isRunning() const;

            /**
             * Handles one datagram received from `sender`. This is what the
             * receive handler calls; datagrams can also be fed in directly.
             */
            void ingest(const udp::endpoint& sender, const std::vector<uint8_t>& datagram);

            /**
             * One prune pass against the current time.
             */
            void prune();

        private:
            enum class State { Idle, Running, Stopped };

            void doReceive();
            void backgroundLoop();
            void broadcastProbe();
            boost::system::error_code enableNatTraversal();

            const std::string type;
            const DiscoveryConfig config;
            const std::vector<uint8_t> prefix;  // encoded beaconType
            const std::vector<uint8_t> probe;

            boost::asio::io_context io;
            boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard;
            udp::socket socket;
            udp::endpoint remote;
            std::vector<uint8_t> recvBuf;

            PeerTable table;

            mutable std::mutex stateMtx;
            std::condition_variable wakeUp;
            State state = State::Idle;
            udp::endpoint boundEndpoint;

            std::thread ioThread;
            std::thread loopThread;
    };

} // namespace lanbeacon

#endif // LANBEACON_DISCOVERY_ENGINE_HPP
