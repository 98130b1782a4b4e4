#pragma once

#include <string_view>

namespace mt::diag
{

inline constexpr const char kTraceEnvVar[] = "MT_PARSE_TRACE";
inline constexpr const char kTraceLogEnvVar[] = "MT_PARSE_TRACE_LOG";

// Read once from MT_PARSE_TRACE.
bool traceEnabled();

// Writes one complete line to MT_PARSE_TRACE_LOG if it names a writable file,
// std::cerr otherwise. Safe to call from several threads; lines never
// interleave.
void traceLine(std::string_view line);

} // namespace mt::diag
