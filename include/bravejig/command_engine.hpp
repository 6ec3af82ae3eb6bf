#pragma once
/**
 * @page bj-command-engine BraveJIG Command Engine
 * @file command_engine.hpp
 * @brief Synchronous facade over the asynchronous link: send, then block for the reply.
 *
 * @details
 * execute(request, key, timeout):
 *   1. Reject unless the Transport is monitoring            -> Connection
 *   2. Register a PendingRequest under key; a second one for
 *      the same key fails fast and sends nothing             -> Busy
 *   3. Queue the request on the Transport                    -> Write on failure
 *   4. Block on the request's future up to timeout
 *      - Dispatcher resolved it                              -> success + frame
 *      - Dispatcher failed it (error notification)           -> Device
 *      - Connection torn down                                -> Disconnected
 *      - deadline passed: entry removed, late reply dropped  -> Timeout
 *
 * No retries happen here; the router/module layers decide that.
 */

#include <chrono>
#include <string>

#include "bravejig/packets.hpp"
#include "bravejig/result.hpp"

namespace bravejig {

class CorrelationTable;
class Logger;
namespace transport { class Transport; }

class CommandEngine {
public:
    CommandEngine(transport::Transport& tx, CorrelationTable& table, Logger& log);

    CommandResult execute(const Bytes& request, const std::string& key,
                          std::chrono::milliseconds timeout);

    bool ready() const;

private:
    transport::Transport& tx_;
    CorrelationTable& table_;
    Logger& log_;
};

} // namespace bravejig
