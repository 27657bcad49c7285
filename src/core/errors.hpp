/**
 * @file   errors.hpp
 * @brief  Error taxonomy of the bridge: every failure that crosses the
 *         channel is a BridgeError carrying an ErrorKind.
 *
 * @date   2026-10-19
 */

#ifndef PROVIDER_BRIDGE_ERRORS_HPP
#define PROVIDER_BRIDGE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace provider_bridge {

/**
 * @brief Classification of a failed request.
 */
enum class ErrorKind {
    ContractViolation, ///< Provider returned a forbidden payload shape
    ProviderFailure,   ///< Provider raised during initialize/getMessages/close
    ProtocolError,     ///< Malformed request, unknown method or out-of-order request
    ChannelFailure     ///< Channel closed or unusable while awaiting a reply
};

/** @return Wire name of the kind, e.g. "ContractViolation". */
const char* errorKindName(ErrorKind kind) noexcept;

/**
 * @brief Parse a wire name back into an ErrorKind.
 * @return ProviderFailure for unknown names.
 */
ErrorKind errorKindFromName(const std::string& name) noexcept;

/**
 * @class BridgeError
 * @brief Request-scoped failure with a kind, surfaced verbatim to the caller.
 */
class BridgeError : public std::runtime_error {
public:
    BridgeError(ErrorKind kind, const std::string& message)
      : std::runtime_error(message)
      , m_kind(kind)
    {}

    ErrorKind kind() const noexcept { return m_kind; }

private:
    ErrorKind m_kind;
};

/**
 * @class UnknownProviderError
 * @brief Raised by the registry when a descriptor names no known provider.
 */
class UnknownProviderError : public BridgeError {
public:
    explicit UnknownProviderError(const std::string& name)
      : BridgeError(ErrorKind::ProviderFailure, "Unknown provider: " + name)
    {}
};

} // namespace provider_bridge

#endif // PROVIDER_BRIDGE_ERRORS_HPP
