#pragma once
/**
 * @file packet_json.hpp
 * @brief JSON rendering of decoded frames and command results (nlohmann/json).
 *
 * Used by the CLI for `--format json` and by the monitor. Field names follow
 * describe() in codec.hpp so both output formats read the same.
 */

#include "nlohmann/json.hpp"

#include "bravejig/packets.hpp"

namespace bravejig {

struct CommandResult;
struct DfuReport;

nlohmann::json to_json(const Frame& f);
nlohmann::json to_json(const CommandResult& r);
nlohmann::json to_json(const DfuReport& r);

} // namespace bravejig
