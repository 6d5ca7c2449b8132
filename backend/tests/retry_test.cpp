#include "core/retry.hpp"

#include <cassert>
#include <chrono>
#include <vector>

int main() {
    using namespace candlecast::core;
    using std::chrono::milliseconds;

    RetryPolicy policy;
    assert(backoff_delay(policy, 0) == milliseconds(1000));
    assert(backoff_delay(policy, 1) == milliseconds(2000));
    assert(backoff_delay(policy, 10) == milliseconds(60000));

    assert(is_transient_error(make_error(ErrorCode::Timeout, "predict")));
    assert(is_transient_error(make_error(ErrorCode::Io, "HTTP 503 from model server")));
    assert(is_transient_error(make_error(ErrorCode::Io, "Connection refused")));
    assert(!is_transient_error(make_error(ErrorCode::Parse, "bad json")));

    // Transient failures are retried with growing delays, then succeed.
    std::vector<milliseconds> sleeps;
    Sleeper record = [&](milliseconds delay) { sleeps.push_back(delay); };
    int calls = 0;
    Expected<int> value = retry_with_backoff(
        policy,
        [&]() -> Expected<int> {
            if (++calls < 3) return make_error(ErrorCode::Unavailable, "busy");
            return 42;
        },
        record);
    assert(value && value.value() == 42);
    assert(calls == 3);
    assert(sleeps.size() == 2 && sleeps[0] == milliseconds(1000) && sleeps[1] == milliseconds(2000));

    // Attempts are capped.
    sleeps.clear();
    calls = 0;
    Status status = retry_with_backoff(
        policy, [&]() -> Status { ++calls; return make_error(ErrorCode::Timeout, "timed out"); }, record);
    assert(status.error() == ErrorCode::Timeout);
    assert(calls == 3 && sleeps.size() == 2);

    // Permanent errors are not retried.
    sleeps.clear();
    calls = 0;
    status = retry_with_backoff(
        policy, [&]() -> Status { ++calls; return make_error(ErrorCode::Invalid, "bad version"); }, record);
    assert(status.error() == ErrorCode::Invalid);
    assert(calls == 1 && sleeps.empty());
    return 0;
}
