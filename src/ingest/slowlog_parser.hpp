#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "core/request_event.hpp"

namespace ingest {

enum class SlowlogParseResult : std::uint8_t { Ok, Skipped, Malformed };

// Parses one Elasticsearch search slowlog line:
//   [<timestamp>][<level>][<a.b.query>] [<index>]... source[<json>], extra_source[<json>]
// Lines whose request type does not end in "query" (fetch phase, index
// slowlog) and blank lines are Skipped. On Malformed, error names the cause.
SlowlogParseResult parse_slowlog_line(std::string_view line, core::RequestEvent& out, std::string& error);

// Accepts "YYYY-MM-DDTHH:MM:SS" or "YYYY-MM-DD HH:MM:SS" (UTC), optionally
// followed by ",<fraction>" which is dropped.
bool parse_slowlog_timestamp(std::string_view text, core::LogTime& out) noexcept;

} // namespace ingest
