// modules/context/context_engine.h
#ifndef RESEARCHFLOW_MODULES_CONTEXT_CONTEXT_ENGINE_H
#define RESEARCHFLOW_MODULES_CONTEXT_CONTEXT_ENGINE_H

#include "core/types/context.h"
#include "core/types/node.h"
#include "modules/context/state_schema.h"
#include <nlohmann/json.hpp>
#include <vector>

namespace researchflow {

// One branch's contribution to a barrier generation.
struct BranchUpdate {
    NodeId source;
    PartialUpdate update;
};

class ContextEngine {
public:
    explicit ContextEngine(const StateSchema& schema = StateSchema::instance())
        : schema_(schema) {}

    // Applies one partial update field by field according to the schema.
    // Fields absent from the update are left untouched.
    // Throws StateMergeError on schema violations; `state` is unchanged then.
    void merge(Context& state, const PartialUpdate& update) const;

    // Applies every update of one fan-out generation. Updates are applied
    // in NodeId order, so the result does not depend on completion order.
    void merge_generation(Context& state, std::vector<BranchUpdate> updates) const;

    // Pure variant of merge().
    [[nodiscard]] Context merged(const Context& state, const PartialUpdate& update) const;

private:
    const StateSchema& schema_;

    static void merge_append(Value& target, const Value& source);
    static void merge_union(Value& target, const Value& source);
    static void merge_set_once(const FieldSpec& spec, Value& target, const Value& source);
};

} // namespace researchflow

#endif // RESEARCHFLOW_MODULES_CONTEXT_CONTEXT_ENGINE_H
