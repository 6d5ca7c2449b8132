#ifndef CANDLECAST_CORE_ERRORS_H
#define CANDLECAST_CORE_ERRORS_H

#ifdef __cplusplus
extern "C" {
#endif

typedef enum CandlecastStatus {
    CANDLECAST_OK = 0,
    CANDLECAST_ERR_PARSE = 1,
    CANDLECAST_ERR_IO = 2,
    CANDLECAST_ERR_RANGE = 3,
    CANDLECAST_ERR_TIMEOUT = 4,
    CANDLECAST_ERR_PROTO = 5,
    CANDLECAST_ERR_NOMEM = 6,
    CANDLECAST_ERR_INVALID = 7,
    CANDLECAST_ERR_NOT_FOUND = 8,
    CANDLECAST_ERR_QUOTA = 9,
    CANDLECAST_ERR_UNAVAILABLE = 10
} CandlecastStatus;

const char* candlecast_status_name(CandlecastStatus status);

#ifdef __cplusplus
}
#endif

#endif // CANDLECAST_CORE_ERRORS_H
