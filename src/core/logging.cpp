/**
 * @file   logging.cpp
 * @brief  Defines the bridge logging categories.
 *
 * Debug output is off by default; info and above are on.
 *
 * @date   2026-10-19
 */

#include "logging.hpp"

#include <QString>

Q_LOGGING_CATEGORY(lcEndpoint, "provider_bridge.endpoint", QtInfoMsg)
Q_LOGGING_CATEGORY(lcRpc,      "provider_bridge.rpc",      QtInfoMsg)
Q_LOGGING_CATEGORY(lcIo,       "provider_bridge.io",       QtInfoMsg)
Q_LOGGING_CATEGORY(lcProvider, "provider_bridge.provider", QtInfoMsg)
Q_LOGGING_CATEGORY(lcHost,     "provider_bridge.host",     QtInfoMsg)

namespace provider_bridge {

void applyLogRules(const std::string& rules) {
    if (rules.empty()) return;
    QString r = QString::fromStdString(rules);
    r.replace(QLatin1Char(';'), QLatin1Char('\n'));
    QLoggingCategory::setFilterRules(r);
}

} // namespace provider_bridge
