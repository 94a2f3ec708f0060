#pragma once
#ifndef LANBEACON_PEER_TABLE_HPP
#define LANBEACON_PEER_TABLE_HPP

#include "PeerRecord.hpp"
#include <chrono>
#include <functional>
#include <mutex>
#include <vector>

namespace lanbeacon {

    /**
     * The set of currently known peers, unique by address and kept in
     * canonical order, plus the last snapshot handed to listeners.
     *
     * merge() and prune() are the only mutators. Each holds the table lock
     * for the whole mutate / compare / commit / publish sequence, so the two
     * can be called from different threads. Listeners are invoked on the
     * calling thread with the lock held, after the new snapshot has been
     * committed; they must not call back into the table.
     */
    class PeerTable {
        public:
            using PeersCallback = std::function<void(const std::vector<PeerRecord>&)>;

            PeerTable() = default;
            ~PeerTable() = default;

            PeerTable(const PeerTable&) = delete;
            PeerTable& operator=(const PeerTable&) = delete;

            /**
             * Registers a listener for every snapshot published from now on.
             */
            void addListener(PeersCallback cb);

            /**
             * Replaces any record with the same address by `record`.
             * Returns true if a new snapshot was published.
             */
            bool merge(const PeerRecord& record);

            /**
             * Drops records whose lastSeen is older than `now - timeout`.
             * Returns true if a new snapshot was published.
             */
            bool prune(Clock::time_point now, std::chrono::milliseconds timeout);

            /**
             * Last published snapshot.
             */
            std::vector<PeerRecord> snapshot() const;

            /**
             * Number of records held, including refreshes not yet visible in
             * the snapshot.
             */
            size_t size() const;

        private:
            // Caller holds mtx.
            bool publishIfChanged();

            mutable std::mutex mtx;
            std::vector<PeerRecord> peers;    // canonical order
            std::vector<PeerRecord> current;  // last published
            std::vector<PeersCallback> listeners;
    };

} // namespace lanbeacon

#endif // LANBEACON_PEER_TABLE_HPP
