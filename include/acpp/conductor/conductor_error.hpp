#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Conductor Error
// ═══════════════════════════════════════════════════════════════════════════

#include "acpp/transport.hpp"

#include <tl/expected.hpp>

#include <string>
#include <string_view>

namespace acpp {

enum class ConductorErrorCode {
    InvalidState,         ///< Operation not allowed in the current state
    InstantiationFailed,  ///< Instantiator could not produce components
    ConnectionFailed,     ///< A connector failed to connect
    ShutDown              ///< Conductor shut down while the operation ran
};

[[nodiscard]] constexpr std::string_view to_string(ConductorErrorCode code) noexcept {
    switch (code) {
        case ConductorErrorCode::InvalidState:        return "InvalidState";
        case ConductorErrorCode::InstantiationFailed: return "InstantiationFailed";
        case ConductorErrorCode::ConnectionFailed:    return "ConnectionFailed";
        case ConductorErrorCode::ShutDown:            return "ShutDown";
    }
    return "Unknown";
}

struct ConductorError {
    ConductorErrorCode code;
    std::string message;

    [[nodiscard]] static ConductorError invalid_state(std::string msg) {
        return {ConductorErrorCode::InvalidState, std::move(msg)};
    }

    [[nodiscard]] static ConductorError instantiation_failed(std::string msg) {
        return {ConductorErrorCode::InstantiationFailed, std::move(msg)};
    }

    [[nodiscard]] static ConductorError connection_failed(std::string_view what, const TransportError& cause) {
        return {ConductorErrorCode::ConnectionFailed, std::string(what) + ": " + cause.message};
    }

    [[nodiscard]] static ConductorError shut_down() {
        return {ConductorErrorCode::ShutDown, "Conductor is shut down"};
    }
};

template <typename T>
using ConductorResult = tl::expected<T, ConductorError>;

}  // namespace acpp
