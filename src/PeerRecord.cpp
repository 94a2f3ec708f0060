#include "PeerRecord.hpp"
#include <algorithm>
#include <sstream>
#include <utility>

namespace lanbeacon {

    PeerRecord::PeerRecord(udp::endpoint address, std::string payload, Clock::time_point lastSeen)
        : address_(std::move(address)),
        payload_(std::move(payload)),
        lastSeen_(lastSeen) {}

    std::string PeerRecord::toString() const {
        std::ostringstream out;
        out << payload_ << "@" << address_.address().to_string() << ":" << address_.port();
        return out.str();
    }

    std::ostream& operator<<(std::ostream& os, const PeerRecord& record) {
        return os << record.toString();
    }

    int compareAddress(const udp::endpoint& a, const udp::endpoint& b) {
        int c = a.address().to_string().compare(b.address().to_string());
        if (c != 0) return c;

        // higher port first
        return static_cast<int>(b.port()) - static_cast<int>(a.port());
    }

    bool canonicalLess(const PeerRecord& a, const PeerRecord& b) {
        int c = a.payload().compare(b.payload());
        if (c != 0) return c < 0;
        return compareAddress(a.address(), b.address()) < 0;
    }

    void sortCanonical(std::vector<PeerRecord>& records) {
        std::sort(records.begin(), records.end(), canonicalLess);
    }

    bool samePeers(const std::vector<PeerRecord>& a, const std::vector<PeerRecord>& b) {
        return std::equal(a.begin(), a.end(), b.begin(), b.end(),
            [](const PeerRecord& x, const PeerRecord& y) {
                return x.address() == y.address() && x.payload() == y.payload();
            });
    }

} // namespace lanbeacon
