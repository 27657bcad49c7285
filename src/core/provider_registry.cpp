/**
 * @file   provider_registry.cpp
 * @brief  Implements ProviderRegistry and the built-in provider table.
 *
 * @date   2026-10-19
 */

#include "provider_registry.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "providers/logging_provider.hpp"
#include "providers/synthetic_provider.hpp"

#include <stdexcept>

namespace provider_bridge {

void ProviderRegistry::add(const std::string& name, Creator creator) {
    if (name.empty() || !creator)
        throw std::invalid_argument("provider creator needs a name and a callable");
    if (!m_creators.emplace(name, std::move(creator)).second)
        throw std::invalid_argument("provider already registered: " + name);
}

bool ProviderRegistry::contains(const std::string& name) const noexcept {
    return m_creators.find(name) != m_creators.end();
}

std::vector<std::string> ProviderRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(m_creators.size());
    for (auto const& kv : m_creators)
        out.push_back(kv.first);
    return out;
}

std::unique_ptr<Provider>
ProviderRegistry::create(const ProviderDescriptor& descriptor) const {
    auto it = m_creators.find(descriptor.name);
    if (it == m_creators.end())
        throw UnknownProviderError(descriptor.name);

    qCDebug(lcProvider) << "creating provider" << descriptor.name.c_str()
                        << "children=" << descriptor.children.size();
    auto provider = it->second(descriptor, *this);
    if (!provider)
        throw BridgeError(ErrorKind::ProviderFailure,
                          "Provider creator returned nothing: " + descriptor.name);
    return provider;
}

ProviderFactory ProviderRegistry::factory() const {
    return [this](const ProviderDescriptor& d) { return create(d); };
}

void registerBuiltinProviders(ProviderRegistry& registry) {
    registry.add("synthetic",
        [](const ProviderDescriptor& d, const ProviderRegistry&) -> std::unique_ptr<Provider> {
            return std::make_unique<providers::SyntheticProvider>(
                providers::SyntheticOptions::fromJson(d.args));
        });

    registry.add("logging",
        [](const ProviderDescriptor& d, const ProviderRegistry& reg) -> std::unique_ptr<Provider> {
            if (d.children.size() != 1)
                throw BridgeError(ErrorKind::ProviderFailure,
                                  "logging provider needs exactly one child");
            return std::make_unique<providers::LoggingProvider>(
                reg.create(d.children.front()),
                d.args.value("label", d.children.front().name));
        });
}

} // namespace provider_bridge
