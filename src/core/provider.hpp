/**
 * @file   provider.hpp
 * @brief  The Provider capability, its ExtensionPoint callbacks and the
 *         ProviderDescriptor tree that names which provider to build.
 *
 * A Provider is opaque to the bridge: it is produced by a factory supplied
 * by the hosting environment and driven only through initialize(),
 * getMessages() and close().
 *
 * @date   2026-10-19
 */

#ifndef PROVIDER_BRIDGE_PROVIDER_HPP
#define PROVIDER_BRIDGE_PROVIDER_HPP

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "types.hpp"

namespace provider_bridge {

/**
 * @struct ExtensionPoint
 * @brief  Push-style callbacks a provider invokes on its own schedule,
 *         independent of any pending request.
 *
 * The owner of the ExtensionPoint keeps it alive for the whole provider
 * lifetime. Callbacks may be invoked from any thread.
 */
struct ExtensionPoint {
    std::function<void(const Progress&)>                progressCallback;
    std::function<void(const ProviderMetadata&)>        reportMetadataCallback;
    std::function<void(const NotifyPlayerManagerData&)> notifyPlayerManager;
};

/**
 * @class Provider
 * @brief A capability producing time-ranged message batches on demand.
 *
 * Calls may block the calling thread while the provider does its own I/O.
 * Range bounds are inclusive; tie-breaking at the boundaries is defined by
 * each implementation.
 */
class Provider {
public:
    virtual ~Provider() = default;

    /**
     * @brief Prepare the provider; the extension point stays valid until
     *        close() returns.
     * @throws std::exception on failure.
     */
    virtual InitializationResult initialize(ExtensionPoint& extensionPoint) = 0;

    /**
     * @brief Fetch the records of the requested topics in [start, end].
     * @throws std::exception on failure.
     */
    virtual MessageBatch getMessages(Time start, Time end,
                                     const GetMessagesTopics& topics) = 0;

    /** @brief Release all resources; no further calls follow. */
    virtual void close() = 0;
};

/**
 * @struct ProviderDescriptor
 * @brief  Serializable description of a provider tree: the provider kind,
 *         its arguments and its nested children.
 */
struct ProviderDescriptor {
    std::string                     name;                            ///< Provider kind
    nlohmann::json                  args = nlohmann::json::object(); ///< Kind-specific arguments
    std::vector<ProviderDescriptor> children;                        ///< Nested providers
};

/// Builds a provider tree from its descriptor; supplied by the environment.
using ProviderFactory =
    std::function<std::unique_ptr<Provider>(const ProviderDescriptor&)>;

} // namespace provider_bridge

namespace nlohmann {

template <>
struct adl_serializer<provider_bridge::ProviderDescriptor> {
    static void to_json(json& j, provider_bridge::ProviderDescriptor const& d) {
        j = json{{"name", d.name}, {"args", d.args}};
        json children = json::array();
        for (auto const& c : d.children) {
            json cj;
            to_json(cj, c);
            children.push_back(std::move(cj));
        }
        j["children"] = std::move(children);
    }
    static void from_json(json const& j, provider_bridge::ProviderDescriptor& d) {
        j.at("name").get_to(d.name);
        d.args = j.contains("args") ? j.at("args") : json::object();
        d.children.clear();
        if (!j.contains("children")) return;
        for (auto const& cj : j.at("children")) {
            provider_bridge::ProviderDescriptor c;
            from_json(cj, c);
            d.children.push_back(std::move(c));
        }
    }
};

} // namespace nlohmann

#endif // PROVIDER_BRIDGE_PROVIDER_HPP
