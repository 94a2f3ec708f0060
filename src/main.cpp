#include <iostream>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <thread>
#include <chrono>

#include "DiscoveryEngine.hpp"

using namespace std;

static atomic<bool> g_running(true);

void signal_handler(int signum){
    (void)signum;
    g_running = false;
}

int main(int argc, char** argv) {
    string beaconType = "lanbeacon";
    lanbeacon::DiscoveryConfig config;

    if (argc > 1) beaconType = argv[1];
    if (argc > 2) {
        int port = atoi(argv[2]);
        if (port <= 0 || port > 65535) {
            cerr << "Invalid discovery port: " << argv[2] << endl;
            return 1;
        }
        config.discoveryPort = static_cast<uint16_t>(port);
    }

    cout << "Probing for '" << beaconType << "' beacons on UDP port " << config.discoveryPort << endl;

    lanbeacon::DiscoveryEngine engine(beaconType, config);

    // Runs on the engine's threads; cout is the only shared state.
    engine.onPeersChanged([](const vector<lanbeacon::PeerRecord>& peers) {
        cout << peers.size() << " beacon(s):" << endl;
        for (auto const& peer : peers) {
            cout << "  " << peer << endl;
        }
    });

    try {
        engine.start();
    } catch (const exception& e) {
        cerr << "Failed to start discovery: " << e.what() << endl;
        return 1;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    cout << "Listening on " << engine.localEndpoint() << ". Press Ctrl+C to exit." << endl;
    while (g_running) {
        this_thread::sleep_for(chrono::milliseconds(200));
    }

    cout << "Shutting down..." << endl;
    engine.stop();
    return 0;
}
