#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>

namespace candlecast::core {

constexpr int64_t kMillisPerMinute = 60LL * 1000LL;
constexpr int64_t kMillisPerDay = 24LL * 60LL * kMillisPerMinute;

// Monotonic clock for latency measurements (not wall clock).
uint64_t now_ns();

// Wall clock (UTC) in nanoseconds since epoch.
uint64_t unix_now_ns();
int64_t unix_now_ms();

// Format UTC timestamp with nanoseconds: YYYY-MM-DD HH:MM:SS.nnnnnnnnn+00
void format_utc(uint64_t ts_ns, char* out, size_t out_len);
std::string to_utc(uint64_t ts_ns);

// Document ids: YYYY-MM-DDTHH:MM:SS+00:00
std::string format_iso8601(int64_t ts_ms);

// Ledger rows: YYYY-MM-DD HH:MM:SS+00:00
std::string format_ledger_time(int64_t ts_ms);

// Compact stamp for file names: YYYYmmdd_HHMMSS
std::string format_file_stamp(int64_t ts_ms);

// Accepts 'T' or ' ' as separator, optional fractional seconds, and an
// optional "Z" or "+00:00" suffix. Bare integers are read as epoch millis.
bool parse_iso8601(std::string_view text, int64_t* out_ms);

// First minute boundary strictly after ts_ms.
int64_t next_minute_boundary(int64_t ts_ms);

} // namespace candlecast::core
