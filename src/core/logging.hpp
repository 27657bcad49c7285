/**
 * @file   logging.hpp
 * @brief  Qt logging categories used across the bridge.
 *
 * Categories can be filtered at runtime with QT_LOGGING_RULES or with the
 * "logRules" key of the host configuration, e.g.
 * "provider_bridge.rpc.debug=true".
 *
 * @date   2026-10-19
 */

#ifndef PROVIDER_BRIDGE_LOGGING_HPP
#define PROVIDER_BRIDGE_LOGGING_HPP

#include <string>
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcEndpoint)
Q_DECLARE_LOGGING_CATEGORY(lcRpc)
Q_DECLARE_LOGGING_CATEGORY(lcIo)
Q_DECLARE_LOGGING_CATEGORY(lcProvider)
Q_DECLARE_LOGGING_CATEGORY(lcHost)

namespace provider_bridge {

/** @brief Install Qt logging filter rules (';' or newline separated). */
void applyLogRules(const std::string& rules);

} // namespace provider_bridge

#endif // PROVIDER_BRIDGE_LOGGING_HPP
