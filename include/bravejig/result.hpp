#pragma once
/**
 * @file result.hpp
 * @brief Uniform (success, kind, message) result returned by every command.
 *
 * Commands never throw across the transport boundary. A failed command
 * carries one ErrorKind plus a message meant for humans; a successful one
 * may carry the decoded response frame.
 */

#include <optional>
#include <string>
#include <utility>

#include "bravejig/packets.hpp"

namespace bravejig {

enum class ErrorKind : uint8_t {
    None,
    Connection,    ///< port open/close failure, or not connected
    Timeout,       ///< no response within the deadline
    Write,         ///< send queue full or write failed
    Protocol,      ///< decode failure or unexpected response kind
    Device,        ///< router/module returned a non-success result
    Dfu,           ///< DFU rejected, chunk/block failure, CRC mismatch
    Disconnected,  ///< connection closed while the request was pending
    Busy,          ///< a request with the same correlation key is in flight
    Invalid        ///< argument rejected before anything was sent
};

/// Stable snake_case name, used as the CLI `reason=` value.
const char* to_string(ErrorKind k);

struct CommandResult {
    bool success{false};
    ErrorKind kind{ErrorKind::None};
    std::string message;
    std::optional<Frame> response;

    static CommandResult ok(Frame f, std::string msg = {}) {
        CommandResult r;
        r.success = true;
        r.response = std::move(f);
        r.message = std::move(msg);
        return r;
    }

    static CommandResult fail(ErrorKind k, std::string msg) {
        CommandResult r;
        r.kind = k;
        r.message = std::move(msg);
        return r;
    }
};

} // namespace bravejig
