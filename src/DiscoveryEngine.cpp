#include "DiscoveryEngine.hpp"
#include "WireCodec.hpp"
#include <iostream>
#include <stdexcept>
#include <utility>

namespace lanbeacon {

    DiscoveryEngine::DiscoveryEngine(std::string beaconType, DiscoveryConfig cfg)
        : type(std::move(beaconType)),
        config(cfg),
        prefix(encodeString(type)),
        probe(buildProbe(type)),
        io(),
        workGuard(boost::asio::make_work_guard(io)),
        socket(io),
        recvBuf(MAX_DATAGRAM_SIZE) {}

    DiscoveryEngine::~DiscoveryEngine() {
        stop();
    }

    void DiscoveryEngine::start() {
        std::lock_guard<std::mutex> lk(stateMtx);
        if (state == State::Running) return;
        if (state == State::Stopped) {
            throw std::logic_error("DiscoveryEngine: a stopped engine cannot be restarted");
        }

        try {
            socket.open(udp::v4());
            socket.set_option(udp::socket::reuse_address(true));
            socket.set_option(boost::asio::socket_base::broadcast(true));
            socket.bind(udp::endpoint(config.bindAddress, 0));
            boundEndpoint = socket.local_endpoint();
        } catch (const boost::system::system_error& e) {
            std::cerr << "[DiscoveryEngine] Socket setup failed: " << e.what() << std::endl;
            boost::system::error_code closeError;
            socket.close(closeError);
            boundEndpoint = udp::endpoint();
            throw;
        }

        boost::system::error_code natError = enableNatTraversal();
        if (natError) {
            std::cerr << "[DiscoveryEngine] Error switching on NAT traversal: " << natError.message() << std::endl;
        }

        state = State::Running;
        doReceive();

        ioThread = std::thread([this] {
            try {
                io.run();
            } catch (const std::exception& e) {
                std::cerr << "[DiscoveryEngine] IO context error: " << e.what() << std::endl;
            }
        });
        loopThread = std::thread([this] { backgroundLoop(); });
    }

    void DiscoveryEngine::stop() {
        {
            std::lock_guard<std::mutex> lk(stateMtx);
            if (state == State::Stopped) return;

            bool wasRunning = (state == State::Running);
            state = State::Stopped;
            if (!wasRunning) return;
        }

        wakeUp.notify_all();
        if (loopThread.joinable()) {
            loopThread.join();
        }

        // The control thread is gone; close on the io thread so no send or
        // receive is in flight on the socket.
        boost::asio::post(io, [this] {
            boost::system::error_code closeError;
            socket.close(closeError);
        });
        workGuard.reset();
        if (ioThread.joinable()) {
            ioThread.join();
        }

        std::lock_guard<std::mutex> lk(stateMtx);
        boundEndpoint = udp::endpoint();
    }

    void DiscoveryEngine::onPeersChanged(PeersCallback cb) {
        table.addListener(std::move(cb));
    }

    std::vector<PeerRecord> DiscoveryEngine::currentPeers() const {
        return table.snapshot();
    }

    udp::endpoint DiscoveryEngine::localEndpoint() const {
        std::lock_guard<std::mutex> lk(stateMtx);
        return boundEndpoint;
    }

    bool DiscoveryEngine::isRunning() const {
        std::lock_guard<std::mutex> lk(stateMtx);
        return state == State::Running;
    }

    // ------------------------------------------------------------
    // RECEIVE PATH
    // ------------------------------------------------------------
    void DiscoveryEngine::doReceive() {
        socket.async_receive_from(boost::asio::buffer(recvBuf), remote,
            [this](const boost::system::error_code& ec, size_t bytes) {
                if (ec == boost::asio::error::operation_aborted) return;

                if (ec) {
                    std::cerr << "[DiscoveryEngine] Receive error: " << ec.message() << std::endl;
                } else {
                    std::vector<uint8_t> datagram(recvBuf.begin(), recvBuf.begin() + bytes);
                    try {
                        ingest(remote, datagram);
                    } catch (const std::exception& e) {
                        std::cerr << "[DiscoveryEngine] Error handling datagram from " << remote << ": " << e.what() << std::endl;
                    }
                }

                if (socket.is_open()) doReceive();
            });
    }

    void DiscoveryEngine::ingest(const udp::endpoint& sender, const std::vector<uint8_t>& datagram) {
        // other channels share the port
        if (!hasPrefix(datagram, prefix)) return;

        Reply reply;
        if (!parseReply(datagram, prefix, reply)) {
            std::cerr << "[DiscoveryEngine] Malformed reply from " << sender
                << " (" << datagram.size() << " bytes)" << std::endl;
            return;
        }

        table.merge(PeerRecord(udp::endpoint(sender.address(), reply.port), std::move(reply.payload), Clock::now()));
    }

    // ------------------------------------------------------------
    // CONTROL LOOP
    // ------------------------------------------------------------
    void DiscoveryEngine::backgroundLoop() {
        std::unique_lock<std::mutex> lk(stateMtx);
        while (state == State::Running) {
            lk.unlock();
            broadcastProbe();
            lk.lock();

            wakeUp.wait_for(lk, config.broadcastInterval, [this] { return state != State::Running; });
            if (state != State::Running) break;

            lk.unlock();
            try {
                prune();
            } catch (const std::exception& e) {
                std::cerr << "[DiscoveryEngine] Prune failed: " << e.what() << std::endl;
            }
            lk.lock();
        }
    }

    void DiscoveryEngine::broadcastProbe() {
        udp::endpoint target(config.broadcastAddress, config.discoveryPort);
        boost::asio::post(io, [this, target] {
            boost::system::error_code sendError;
            socket.send_to(boost::asio::buffer(probe), target, 0, sendError);
            if (sendError) {
                std::cerr << "[DiscoveryEngine] Probe to " << target << " failed: " << sendError.message() << std::endl;
            }
        });
    }

    void DiscoveryEngine::prune() {
        table.prune(Clock::now(), config.peerTimeout);
    }

    boost::system::error_code DiscoveryEngine::enableNatTraversal() {
        boost::system::error_code ec;
#if defined(_WIN32) && defined(IPV6_PROTECTION_LEVEL)
        using protection_level = boost::asio::detail::socket_option::integer<IPPROTO_IPV6, IPV6_PROTECTION_LEVEL>;
        socket.set_option(protection_level(PROTECTION_LEVEL_UNRESTRICTED), ec);
#else
        // only Windows exposes an edge traversal socket option
        ec = boost::asio::error::operation_not_supported;
#endif
        return ec;
    }

} // namespace lanbeacon
