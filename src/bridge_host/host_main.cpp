/**
 * @file   host_main.cpp
 * @brief  Standalone host for a provider tree: listens on a socket, accepts
 *         one caller and serves its bridge requests with the bundled
 *         provider registry.
 *
 * Usage: provider_bridge_host [config.json] [address]
 *
 * @date   2026-10-19
 */
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <QCoreApplication>

#include "../core/config.hpp"
#include "../core/logging.hpp"
#include "../core/provider_registry.hpp"
#include "../core/remote_endpoint.hpp"
#include "../core/io/rpc.hpp"
#include "../core/io/socket_channel.hpp"

using namespace std::chrono_literals;
using namespace provider_bridge;

// -----------------------------------------------------------------------------
// Ctrl-C handling: set an atomic flag from signal-handler context
// -----------------------------------------------------------------------------

static std::atomic_bool g_stop{false};

static void onSigInt(int){ g_stop = true; }

// -----------------------------------------------------------------------------
// MAIN
// -----------------------------------------------------------------------------

int main(int argc, char** argv)
{
    QCoreApplication app(argc, argv);

    // 1) Configuration --------------------------------------------------------
    BridgeConfig cfg;
    if (argc > 1 && argv[1][0] != '\0') {
        std::string err;
        if (!loadConfig(argv[1], cfg, &err)) {
            std::cerr << "[provider_bridge_host] ERROR: cannot load '" << argv[1]
                      << "': " << err << "\n";
            return 1;
        }
        if (!err.empty())
            qCWarning(lcHost) << err.c_str();
    }
    if (argc > 2)
        cfg.address = argv[2];
    if (!cfg.logRules.empty())
        applyLogRules(cfg.logRules);

    ProviderRegistry registry;
    registerBuiltinProviders(registry);

    // 2) Wait for the caller --------------------------------------------------
    io::SocketListener listener(cfg.address);
    if (!listener.isListening()) {
        std::cerr << "[provider_bridge_host] ERROR: cannot listen on '" << cfg.address
                  << "': " << listener.error() << "\n";
        return 1;
    }
    qCInfo(lcHost) << "listening on" << cfg.address.c_str();

    std::signal(SIGINT, onSigInt);

    std::shared_ptr<io::SocketChannel> channel;
    while (!g_stop && !channel) {
        channel = listener.accept(200ms);
        if (!channel && !listener.error().empty()) {
            std::cerr << "[provider_bridge_host] ERROR: accept failed: "
                      << listener.error() << "\n";
            return 1;
        }
    }
    if (!channel) return 0;
    qCInfo(lcHost) << "caller connected";

    // 3) Serve until close, hangup or Ctrl-C ----------------------------------
    {
        io::Rpc rpc(channel);
        RemoteEndpoint endpoint(rpc, registry.factory());
        const std::chrono::milliseconds poll{cfg.pollIntervalMs};

        while (!g_stop && !endpoint.closed()) {
            const bool serviced = rpc.pumpFor(poll);
            endpoint.flushEvents();
            if (!serviced && !rpc.isOpen()) {
                qCInfo(lcHost) << "caller hung up";
                break;
            }
        }
        // endpoint goes first: queued requests finish and their replies are sent
    }

    qCInfo(lcHost) << "shutting down";
    return 0;
}
