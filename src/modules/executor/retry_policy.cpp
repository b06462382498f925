// modules/executor/retry_policy.cpp
#include "modules/executor/retry_policy.h"

namespace researchflow {

std::chrono::milliseconds RetryPolicy::backoff_delay(int attempt) const {
    if (attempt < 0) attempt = 0;
    // cap the shift; nobody configures 30+ attempts
    return base_delay * (1LL << std::min(attempt, 30));
}

} // namespace researchflow
