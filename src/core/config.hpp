/**
 * @file   config.hpp
 * @brief  Host configuration: where to listen, how often to service the
 *         channel, and which log categories to enable.
 *
 * The configuration is a small JSON object, e.g.
 * @code
 * { "address": "unix:/tmp/provider_bridge.sock",
 *   "pollIntervalMs": 10,
 *   "logRules": "provider_bridge.*.debug=true" }
 * @endcode
 *
 * @date   2026-10-19
 */

#ifndef PROVIDER_BRIDGE_CONFIG_HPP
#define PROVIDER_BRIDGE_CONFIG_HPP

#include <string>
#include <nlohmann/json.hpp>

namespace provider_bridge {

/**
 * @struct BridgeConfig
 * @brief  Settings of the hosting executable.
 */
struct BridgeConfig {
    std::string address{"unix:/tmp/provider_bridge.sock"}; ///< "unix:/path" or "tcp:host:port"
    int         pollIntervalMs{10};                         ///< Servicing loop wait per iteration
    std::string logRules;                                   ///< Qt logging filter rules
};

/**
 * @brief Load a configuration from a JSON file on disk.
 *
 * Keys missing from the file keep their defaults. Unknown keys are reported
 * as a warning through `err` without failing the load.
 *
 * @param path File path to read from.
 * @param out  Configuration to populate upon success.
 * @param err  Optional out-param that receives an error or warning.
 * @return     true if the file was read (even with warnings), false on I/O,
 *             parse or value errors.
 */
bool loadConfig(const std::string& path,
                BridgeConfig& out,
                std::string* err = nullptr);

} // namespace provider_bridge

namespace nlohmann {

template <>
struct adl_serializer<provider_bridge::BridgeConfig> {
    static void to_json(json& j, provider_bridge::BridgeConfig const& c) {
        j = json{
            {"address",        c.address},
            {"pollIntervalMs", c.pollIntervalMs},
            {"logRules",       c.logRules}
        };
    }
    static void from_json(json const& j, provider_bridge::BridgeConfig& c) {
        if (j.contains("address"))        j.at("address").get_to(c.address);
        if (j.contains("pollIntervalMs")) j.at("pollIntervalMs").get_to(c.pollIntervalMs);
        if (j.contains("logRules"))       j.at("logRules").get_to(c.logRules);
    }
};

} // namespace nlohmann

#endif // PROVIDER_BRIDGE_CONFIG_HPP
