#include "core/retry.hpp"

#include "core/types.hpp"

namespace candlecast::core {

namespace {

constexpr const char* kTransientPatterns[] = {
    "timed out",
    "timeout",
    "connection refused",
    "connection reset",
    "could not connect",
    "couldn't connect",
    "temporarily unavailable",
    "502",
    "503",
    "504",
    "429",
};

} // namespace

bool is_transient_error(const Error& error) {
    if (error.code == ErrorCode::Timeout || error.code == ErrorCode::Unavailable) {
        return true;
    }
    const std::string lowered = to_lower(error.message);
    for (const char* pattern : kTransientPatterns) {
        if (lowered.find(pattern) != std::string::npos) return true;
    }
    return false;
}

} // namespace candlecast::core
