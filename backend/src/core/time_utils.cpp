#include "core/time_utils.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <cstdlib>

namespace candlecast::core {

namespace {

std::tm utc_tm(int64_t ts_ms) {
    int64_t secs = ts_ms / 1000;
    if (ts_ms < 0 && ts_ms % 1000 != 0) --secs;
    time_t t = static_cast<time_t>(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);
    return tm;
}

bool read_digits(std::string_view text, size_t pos, size_t count, int* out) {
    if (pos + count > text.size()) return false;
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
        value = value * 10 + (text[i] - '0');
    }
    *out = value;
    return true;
}

} // namespace

uint64_t now_ns() {
    auto now = std::chrono::steady_clock::now().time_since_epoch();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

uint64_t unix_now_ns() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

int64_t unix_now_ms() {
    return static_cast<int64_t>(unix_now_ns() / 1000000ULL);
}

void format_utc(uint64_t ts_ns, char* out, size_t out_len) {
    if (!out || out_len == 0) return;

    time_t secs = static_cast<time_t>(ts_ns / 1000000000ULL);
    uint32_t ns = static_cast<uint32_t>(ts_ns % 1000000000ULL);

    std::tm tm{};
    gmtime_r(&secs, &tm);

    char base[32];
    strftime(base, sizeof(base), "%Y-%m-%d %H:%M:%S", &tm);
    std::snprintf(out, out_len, "%s.%09u+00", base, ns);
}

std::string to_utc(uint64_t ts_ns) {
    char buffer[64];
    format_utc(ts_ns, buffer, sizeof(buffer));
    return std::string(buffer);
}

std::string format_iso8601(int64_t ts_ms) {
    std::tm tm = utc_tm(ts_ms);
    char buffer[40];
    strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S+00:00", &tm);
    return std::string(buffer);
}

std::string format_ledger_time(int64_t ts_ms) {
    std::tm tm = utc_tm(ts_ms);
    char buffer[40];
    strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S+00:00", &tm);
    return std::string(buffer);
}

std::string format_file_stamp(int64_t ts_ms) {
    std::tm tm = utc_tm(ts_ms);
    char buffer[32];
    strftime(buffer, sizeof(buffer), "%Y%m%d_%H%M%S", &tm);
    return std::string(buffer);
}

bool parse_iso8601(std::string_view text, int64_t* out_ms) {
    if (!out_ms) return false;
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
    if (text.empty()) return false;

    bool all_digits = true;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (!(std::isdigit(static_cast<unsigned char>(c)) || (i == 0 && c == '-'))) {
            all_digits = false;
            break;
        }
    }
    if (all_digits) {
        std::string copy(text);
        char* end = nullptr;
        long long value = std::strtoll(copy.c_str(), &end, 10);
        if (!end || *end != '\0') return false;
        *out_ms = static_cast<int64_t>(value);
        return true;
    }

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!read_digits(text, 0, 4, &year) || text.size() < 19 || text[4] != '-' ||
        !read_digits(text, 5, 2, &month) || text[7] != '-' ||
        !read_digits(text, 8, 2, &day) || (text[10] != 'T' && text[10] != ' ') ||
        !read_digits(text, 11, 2, &hour) || text[13] != ':' ||
        !read_digits(text, 14, 2, &minute) || text[16] != ':' ||
        !read_digits(text, 17, 2, &second)) {
        return false;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return false;
    }

    size_t pos = 19;
    int64_t millis = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int64_t scale = 100;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            millis += (text[pos] - '0') * scale;
            scale /= 10;
            ++pos;
        }
    }

    std::string_view suffix = text.substr(pos);
    if (!(suffix.empty() || suffix == "Z" || suffix == "+00:00" || suffix == "+00" || suffix == "+0000")) {
        return false;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    time_t secs = timegm(&tm);
    *out_ms = static_cast<int64_t>(secs) * 1000 + millis;
    return true;
}

int64_t next_minute_boundary(int64_t ts_ms) {
    int64_t floor = ts_ms - (ts_ms % kMillisPerMinute);
    if (ts_ms < 0 && ts_ms % kMillisPerMinute != 0) floor -= kMillisPerMinute;
    return floor + kMillisPerMinute;
}

} // namespace candlecast::core
