#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Common Types
// ═══════════════════════════════════════════════════════════════════════════
// Shared types used by every connection implementation.
//
// For the connection contract, use: #include "acpp/connection/connection.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include <tl/expected.hpp>

namespace acpp {

using Json = nlohmann::json;

/// Error type for connection operations
struct TransportError {
    enum class Category {
        Network,   ///< I/O failure (pipe, descriptor, spawn)
        Protocol,  ///< Peer sent something that is not a JSON-RPC message
        Closed     ///< Connection closed or end of stream reached
    };

    Category category{};
    std::string message;
    std::optional<int> os_error{};

    [[nodiscard]] static TransportError network(std::string msg, std::optional<int> err = std::nullopt) {
        return {Category::Network, std::move(msg), err};
    }

    [[nodiscard]] static TransportError protocol(std::string msg) {
        return {Category::Protocol, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static TransportError closed(std::string msg = "Connection is closed") {
        return {Category::Closed, std::move(msg), std::nullopt};
    }

    [[nodiscard]] bool is_closed() const noexcept {
        return category == Category::Closed;
    }
};

/// Result type for connection operations
template <typename T>
using TransportResult = tl::expected<T, TransportError>;

}  // namespace acpp
