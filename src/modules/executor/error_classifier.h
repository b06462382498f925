// modules/executor/error_classifier.h
#ifndef RESEARCHFLOW_MODULES_EXECUTOR_ERROR_CLASSIFIER_H
#define RESEARCHFLOW_MODULES_EXECUTOR_ERROR_CLASSIFIER_H

#include "core/types/errors.h"
#include <exception>
#include <string_view>

namespace researchflow {

// Decides whether a failure is worth retrying.
//
// Order of rules:
//   1. known permanent types (bad input, auth, response shape, cancellation,
//      json type/parse errors) are permanent whatever the message says;
//   2. a ServiceError carrying status 429, 502 or 503 is transient;
//   3. a message containing one of the transient keywords is transient;
//   4. everything else is permanent.
ErrorClass classify_error(const std::exception& e);

// Same as above; non-std exceptions (and a null pointer) are permanent.
ErrorClass classify_error(std::exception_ptr eptr);

// Rule 3 on its own.
bool has_transient_keyword(std::string_view message);

} // namespace researchflow

#endif // RESEARCHFLOW_MODULES_EXECUTOR_ERROR_CLASSIFIER_H
