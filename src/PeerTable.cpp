#include "PeerTable.hpp"
#include <algorithm>
#include <utility>

namespace lanbeacon {

    void PeerTable::addListener(PeersCallback cb) {
        std::lock_guard<std::mutex> lk(mtx);
        listeners.push_back(std::move(cb));
    }

    bool PeerTable::merge(const PeerRecord& record) {
        std::lock_guard<std::mutex> lk(mtx);

        peers.erase(std::remove(peers.begin(), peers.end(), record), peers.end());
        peers.push_back(record);
        sortCanonical(peers);

        return publishIfChanged();
    }

    bool PeerTable::prune(Clock::time_point now, std::chrono::milliseconds timeout) {
        std::lock_guard<std::mutex> lk(mtx);

        const auto cutoff = now - timeout;
        peers.erase(std::remove_if(peers.begin(), peers.end(), [&cutoff](const PeerRecord& p) {
            return p.lastSeen() < cutoff;
        }), peers.end());

        return publishIfChanged();
    }

    std::vector<PeerRecord> PeerTable::snapshot() const {
        std::lock_guard<std::mutex> lk(mtx);
        return current;
    }

    size_t PeerTable::size() const {
        std::lock_guard<std::mutex> lk(mtx);
        return peers.size();
    }

    bool PeerTable::publishIfChanged() {
        if (samePeers(peers, current)) return false;

        current = peers;
        for (auto const& cb : listeners) {
            if (cb) cb(current);
        }

        return true;
    }

} // namespace lanbeacon
