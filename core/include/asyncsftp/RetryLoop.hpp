// Drives a non-blocking transport primitive to completion: whenever it
// answers kWouldBlock, park on a readiness wait and call it again. There is
// no cap on the number of attempts.
#pragma once
#include "Log.hpp"
#include "Transport.hpp"

#include <chrono>
#include <utility>

namespace asyncsftp {

// Results the loop itself produces. Both lie outside the libssh2 range.
constexpr int kRetryInterrupted = -1000; // stop predicate fired
constexpr int kRetryWaitFailed = -1001;  // readiness wait failed (socket gone)

// shouldStop() is checked at the entry of every readiness wait.
template <class Op, class StopPred>
auto retryWhileBlocked(Transport &transport,
                       std::chrono::milliseconds waitTimeout,
                       StopPred &&shouldStop, Op &&op) -> decltype(op()) {
    for (;;) {
        auto rc = op();
        if (rc != kWouldBlock)
            return rc;
        if (shouldStop())
            return kRetryInterrupted;
        const int w = transport.waitSocket(waitTimeout);
        if (w < 0) {
            LOGW("readiness wait failed (%d)", w);
            return kRetryWaitFailed;
        }
        if (w == 0)
            LOGD("readiness wait timed out after %lld ms, retrying",
                 static_cast<long long>(waitTimeout.count()));
    }
}

// Same, for work that cannot be interrupted once started.
template <class Op>
auto retryWhileBlocked(Transport &transport,
                       std::chrono::milliseconds waitTimeout, Op &&op)
    -> decltype(op()) {
    return retryWhileBlocked(
        transport, waitTimeout, [] { return false; }, std::forward<Op>(op));
}

} // namespace asyncsftp
