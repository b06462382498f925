// nodes/fetch_helpers.h
#ifndef RESEARCHFLOW_NODES_FETCH_HELPERS_H
#define RESEARCHFLOW_NODES_FETCH_HELPERS_H

#include "core/types/context.h"
#include "core/types/errors.h"
#include "core/types/node.h"
#include "modules/executor/retry_policy.h"
#include "modules/trace/execution_trace.h"
#include "common/utils/logging.h"
#include <exception>
#include <string>

namespace researchflow {

// One per-identifier call under the runtime's retry policy. On exhausted or
// permanent failure the error is appended to `errors` and the node's trace
// and null is returned, so the caller moves on to the next identifier.
// Cancellation is never absorbed.
template <typename Fetch>
Value fetch_for_ticker(NodeRuntime& runtime, const std::string& node, const std::string& what,
                       const std::string& ticker, Fetch&& fetch, Value& errors) {
    int attempts = 0;
    try {
        return retry_call(runtime.retry, runtime.budget, [&] { return fetch(ticker); },
                          &attempts, node + " " + what + " " + ticker);
    } catch (const CancelledError&) {
        throw;
    } catch (const std::exception& e) {
        logging::get()->error("{}: {} for {} failed after {} attempt(s): {}", node, what, ticker, attempts, e.what());
        runtime.trace.add_step(what + " for " + ticker + " failed after " + std::to_string(attempts) +
                               " attempt(s): " + e.what());
        errors.push_back(node + " error for " + ticker + " (" + what + "): " + e.what());
        return nullptr;
    }
}

} // namespace researchflow

#endif // RESEARCHFLOW_NODES_FETCH_HELPERS_H
