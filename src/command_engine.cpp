// ============================================================================
// command_engine.cpp — implementation for command_engine.hpp
// ============================================================================

#include "bravejig/command_engine.hpp"
#include "bravejig/correlation.hpp"
#include "bravejig/logger.hpp"
#include "bravejig/transport/transport.hpp"

namespace bravejig {

CommandEngine::CommandEngine(transport::Transport& tx, CorrelationTable& table, Logger& log)
    : tx_(tx), table_(table), log_(log) {}

bool CommandEngine::ready() const { return tx_.is_monitoring(); }

CommandResult CommandEngine::execute(const Bytes& request, const std::string& key,
                                     std::chrono::milliseconds timeout) {
    if (!ready()) {
        log_.warn("engine", "rejected", "key=" + key + " reason=not_connected");
        return CommandResult::fail(ErrorKind::Connection, "not connected");
    }

    auto pending = table_.add(key, timeout);
    if (!pending) {
        log_.warn("engine", "rejected", "key=" + key + " reason=request_in_flight");
        return CommandResult::fail(ErrorKind::Busy, "request already in flight for " + key);
    }

    if (!tx_.send(request)) {
        table_.remove(pending);
        return CommandResult::fail(ErrorKind::Write, "failed to queue request for " + key);
    }
    log_.debug("engine", "sent", "key=" + key + " timeout_ms=" + std::to_string(timeout.count()));

    if (pending->future.wait_for(timeout) == std::future_status::ready) {
        CommandResult r = pending->future.get();
        if (!r.success)
            log_.warn("engine", "failed",
                      "key=" + key + " kind=" + to_string(r.kind) + " message=\"" + r.message + "\"");
        return r;
    }

    // Lost the race against a reply landing right at the deadline: take the reply.
    if (!table_.remove(pending)) return pending->future.get();

    log_.warn("engine", "timeout", "key=" + key + " timeout_ms=" + std::to_string(timeout.count()));
    return CommandResult::fail(ErrorKind::Timeout,
                               "no response for " + key + " within " +
                               std::to_string(timeout.count()) + " ms");
}

} // namespace bravejig
