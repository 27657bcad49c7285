/**
 * @file   errors.cpp
 * @brief  Wire names for ErrorKind.
 *
 * @date   2026-10-19
 */

#include "errors.hpp"

namespace provider_bridge {

const char* errorKindName(ErrorKind kind) noexcept {
    switch (kind) {
      case ErrorKind::ContractViolation: return "ContractViolation";
      case ErrorKind::ProviderFailure:   return "ProviderFailure";
      case ErrorKind::ProtocolError:     return "ProtocolError";
      case ErrorKind::ChannelFailure:    return "ChannelFailure";
    }
    return "ProviderFailure";
}

ErrorKind errorKindFromName(const std::string& name) noexcept {
    if (name == "ContractViolation") return ErrorKind::ContractViolation;
    if (name == "ProtocolError")     return ErrorKind::ProtocolError;
    if (name == "ChannelFailure")    return ErrorKind::ChannelFailure;
    return ErrorKind::ProviderFailure;
}

} // namespace provider_bridge
