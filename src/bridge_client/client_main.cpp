/**
 * @file   client_main.cpp
 * @brief  Command-line caller of a hosted provider tree: initializes it from
 *         a descriptor file, prints extension-point events, fetches one range
 *         of raw messages and summarizes them per topic.
 *
 * Usage: provider_bridge_client <address> <descriptor.json> [startSec] [endSec] [topic...]
 *
 * @date   2026-10-19
 */
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <set>
#include <string>
#include <QCoreApplication>

#include <nlohmann/json.hpp>

#include "../core/errors.hpp"
#include "../core/remote_provider.hpp"
#include "../core/io/socket_channel.hpp"

using namespace provider_bridge;
using nlohmann::json;

namespace {

/**
 * Reads a ProviderDescriptor from a JSON file.
 *
 * @param path File to read
 * @param out  Descriptor to fill
 * @param err  Receives the reason on failure
 * @return true on success
 */
bool loadDescriptor(const std::string& path, ProviderDescriptor& out, std::string& err)
{
    std::ifstream in(path);
    if (!in.is_open()) {
        err = "Failed to open file: " + path;
        return false;
    }
    try {
        json j;
        in >> j;
        out = j.get<ProviderDescriptor>();
    }
    catch (const json::exception& e) {
        err = std::string("Descriptor error: ") + e.what();
        return false;
    }
    return true;
}

/** Parses a non-negative seconds argument. */
bool parseSeconds(const char* text, Time& out)
{
    char* endp = nullptr;
    const double s = std::strtod(text, &endp);
    if (endp == text || *endp != '\0' || !(s >= 0.0) || s > 4294967295.0)
        return false;
    out = Time::fromNanoseconds(static_cast<std::uint64_t>(s * 1e9));
    return true;
}

struct TopicSummary {
    std::size_t   count{0};
    std::size_t   bytes{0};
    Time          first;
    Time          last;
};

}// namespace ------------------------------------------------------------------

int main(int argc, char** argv)
{
    QCoreApplication app(argc, argv);
    if (argc < 3) {
        std::cerr << "usage: " << argv[0]
                  << " <address> <descriptor.json> [startSec] [endSec] [topic...]\n";
        return 2;
    }

    ProviderDescriptor descriptor;
    std::string err;
    if (!loadDescriptor(argv[2], descriptor, err)) {
        std::cerr << "[provider_bridge_client] ERROR: " << err << "\n";
        return 1;
    }

    auto channel = io::SocketChannel::connect(argv[1], &err);
    if (!channel) {
        std::cerr << "[provider_bridge_client] ERROR: " << err << "\n";
        return 1;
    }

    ExtensionPoint ext;
    ext.progressCallback = [](const Progress& p) {
        std::cout << "progress: " << json(p).dump() << "\n";
    };
    ext.reportMetadataCallback = [](const ProviderMetadata& m) {
        std::cout << "metadata: " << m.dump() << "\n";
    };
    ext.notifyPlayerManager = [](const NotifyPlayerManagerData& d) {
        std::cout << "notify: " << d.dump() << "\n";
    };

    try {
        RemoteProvider remote(channel, descriptor);

        // 1) Initialize -------------------------------------------------------
        const InitializationResult init = remote.initialize(ext);
        std::cout << "range " << init.start.sec << "." << init.start.nsec
                  << " - " << init.end.sec << "." << init.end.nsec
                  << ", " << init.topics.size() << " topics\n";
        for (auto const& t : init.topics)
            std::cout << "  " << t.name << " [" << t.datatype << "]\n";
        for (auto const& p : init.problems)
            std::cout << "  problem: " << p << "\n";

        // 2) Fetch one range --------------------------------------------------
        Time start = init.start;
        Time end   = init.end;
        if ((argc > 3 && !parseSeconds(argv[3], start)) ||
            (argc > 4 && !parseSeconds(argv[4], end))) {
            std::cerr << "[provider_bridge_client] ERROR: bad time argument\n";
            remote.close();
            return 2;
        }

        GetMessagesTopics topics;
        topics.rawMessages.emplace();
        for (int i = 5; i < argc; ++i)
            topics.rawMessages->push_back(argv[i]);
        if (topics.rawMessages->empty())
            for (auto const& t : init.topics)
                topics.rawMessages->push_back(t.name);

        MessageBatch batch = remote.getMessages(start, end, topics);

        std::map<std::string, TopicSummary> summary;
        std::set<const void*> buffers;
        for (auto const& m : *batch.rawMessages) {
            auto& s = summary[m.topic];
            if (s.count == 0) s.first = m.receiveTime;
            s.last = m.receiveTime;
            ++s.count;
            s.bytes += m.length;
            buffers.insert(m.buffer.get());
        }
        std::cout << batch.rawMessages->size() << " messages in "
                  << buffers.size() << " buffers\n";
        for (auto const& kv : summary) {
            std::cout << "  " << kv.first << ": " << kv.second.count << " msgs, "
                      << kv.second.bytes << " bytes, "
                      << kv.second.first.sec << "." << kv.second.first.nsec << " - "
                      << kv.second.last.sec << "." << kv.second.last.nsec << "\n";
        }

        // 3) Close ------------------------------------------------------------
        remote.close();
    }
    catch (const BridgeError& e) {
        std::cerr << "[provider_bridge_client] " << errorKindName(e.kind())
                  << ": " << e.what() << "\n";
        return 1;
    }
    return 0;
}
