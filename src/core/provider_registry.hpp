/**
 * @file   provider_registry.hpp
 * @brief  Declares ProviderRegistry: resolves a ProviderDescriptor tree to
 *         provider instances through named creators.
 *
 * @date   2026-10-19
 */

#ifndef PROVIDER_BRIDGE_PROVIDER_REGISTRY_HPP
#define PROVIDER_BRIDGE_PROVIDER_REGISTRY_HPP

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "provider.hpp"

namespace provider_bridge {

/**
 * @class ProviderRegistry
 * @brief Name → creator table. Creators get the registry back so they can
 *        build their own children.
 */
class ProviderRegistry {
public:
    using Creator = std::function<std::unique_ptr<Provider>(
        const ProviderDescriptor&, const ProviderRegistry&)>;

    /**
     * @brief Register a creator under a provider kind.
     * @throws std::invalid_argument if the name is empty or already taken.
     */
    void add(const std::string& name, Creator creator);

    /** @return True if a creator is registered under `name`. */
    bool contains(const std::string& name) const noexcept;

    /** @return Registered kinds, sorted. */
    std::vector<std::string> names() const;

    /**
     * @brief Build the provider tree described by `descriptor`.
     * @throws UnknownProviderError if any node names an unknown kind.
     */
    std::unique_ptr<Provider> create(const ProviderDescriptor& descriptor) const;

    /** @return A ProviderFactory bound to this registry (which must outlive it). */
    ProviderFactory factory() const;

private:
    std::map<std::string, Creator> m_creators;
};

/**
 * @brief Register the providers shipped with the host executable
 *        ("synthetic", "logging").
 */
void registerBuiltinProviders(ProviderRegistry& registry);

} // namespace provider_bridge

#endif // PROVIDER_BRIDGE_PROVIDER_REGISTRY_HPP
