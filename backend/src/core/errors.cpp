#include "core/errors.h"

extern "C" const char* candlecast_status_name(CandlecastStatus status) {
    switch (status) {
        case CANDLECAST_OK: return "ok";
        case CANDLECAST_ERR_PARSE: return "parse error";
        case CANDLECAST_ERR_IO: return "io error";
        case CANDLECAST_ERR_RANGE: return "out of range";
        case CANDLECAST_ERR_TIMEOUT: return "timed out";
        case CANDLECAST_ERR_PROTO: return "protocol error";
        case CANDLECAST_ERR_NOMEM: return "out of memory";
        case CANDLECAST_ERR_INVALID: return "invalid argument";
        case CANDLECAST_ERR_NOT_FOUND: return "not found";
        case CANDLECAST_ERR_QUOTA: return "quota exceeded";
        case CANDLECAST_ERR_UNAVAILABLE: return "unavailable";
    }
    return "unknown status";
}
