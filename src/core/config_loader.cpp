/**
 * @file   config_loader.cpp
 * @brief  Implements loadConfig() for the host JSON configuration.
 *
 * @date   2026-10-19
 */

#include "config.hpp"

#include <array>
#include <fstream>

namespace provider_bridge {

bool loadConfig(const std::string& path,
                BridgeConfig& out,
                std::string* err)
{
    std::ifstream in(path);
    if (!in.is_open()) {
        if (err) *err = "Failed to open config: " + path;
        return false;
    }

    nlohmann::json j;
    try {
        in >> j;
    }
    catch (const std::exception& e) {
        if (err) *err = std::string("Config parse error: ") + e.what();
        return false;
    }
    if (!j.is_object()) {
        if (err) *err = "Config must be a JSON object: " + path;
        return false;
    }

    // Unknown keys are tolerated but reported
    static const std::array<const char*, 3> known{"address", "pollIntervalMs", "logRules"};
    std::string warning;
    for (auto it = j.begin(); it != j.end(); ++it) {
        bool isKnown = false;
        for (const char* k : known)
            if (it.key() == k) { isKnown = true; break; }
        if (!isKnown) {
            warning = "Unknown config key `" + it.key() + "` ignored";
            break;
        }
    }

    BridgeConfig cfg = out;
    try {
        j.get_to(cfg);
    }
    catch (const std::exception& e) {
        if (err) *err = std::string("Config schema error: ") + e.what();
        return false;
    }
    if (cfg.address.empty()) {
        if (err) *err = "Config `address` must not be empty";
        return false;
    }
    if (cfg.pollIntervalMs <= 0) {
        if (err) *err = "Config `pollIntervalMs` must be positive";
        return false;
    }

    out = std::move(cfg);
    if (!warning.empty() && err)
        *err = std::move(warning);
    return true;
}

} // namespace provider_bridge
