// modules/context/context_engine.cpp
#include "modules/context/context_engine.h"
#include "core/types/errors.h"
#include "common/utils/logging.h"
#include <algorithm>
#include <unordered_map>

namespace researchflow {

void ContextEngine::merge(Context& state, const PartialUpdate& update) const {
    if (update.is_null() || update.empty()) {
        return;
    }
    schema_.validate_update(update);

    // Work on a copy so a set-once violation half way through leaves `state` intact.
    Context next = state;
    for (auto it = update.begin(); it != update.end(); ++it) {
        const FieldSpec* spec = schema_.find(it.key());
        Value& target = next[it.key()];

        switch (spec->policy) {
            case MergePolicy::OVERWRITE:
                target = it.value();
                break;
            case MergePolicy::APPEND:
                merge_append(target, it.value());
                break;
            case MergePolicy::UNION:
                merge_union(target, it.value());
                break;
            case MergePolicy::SET_ONCE:
                merge_set_once(*spec, target, it.value());
                break;
        }
    }
    state = std::move(next);
}

void ContextEngine::merge_generation(Context& state, std::vector<BranchUpdate> updates) const {
    std::stable_sort(updates.begin(), updates.end(),
                     [](const BranchUpdate& a, const BranchUpdate& b) { return a.source < b.source; });

    // Overwrite fields written by more than one branch are legal but suspicious.
    std::unordered_map<std::string, NodeId> overwrite_writers;
    for (const auto& bu : updates) {
        if (!bu.update.is_object()) continue;
        for (auto it = bu.update.begin(); it != bu.update.end(); ++it) {
            const FieldSpec* spec = schema_.find(it.key());
            if (!spec || spec->policy != MergePolicy::OVERWRITE) continue;
            auto [pos, inserted] = overwrite_writers.emplace(it.key(), bu.source);
            if (!inserted) {
                logging::get()->warn("Field '{}' overwritten by both {} and {} in one generation; {} wins",
                                 it.key(), node_name(pos->second), node_name(bu.source), node_name(bu.source));
                pos->second = bu.source;
            }
        }
    }

    for (const auto& bu : updates) {
        merge(state, bu.update);
    }
}

Context ContextEngine::merged(const Context& state, const PartialUpdate& update) const {
    Context out = state;
    merge(out, update);
    return out;
}

void ContextEngine::merge_append(Value& target, const Value& source) {
    if (!target.is_array()) target = Value::array();
    for (const auto& item : source) {
        target.push_back(item);
    }
}

void ContextEngine::merge_union(Value& target, const Value& source) {
    if (!target.is_object()) target = Value::object();
    for (auto it = source.begin(); it != source.end(); ++it) {
        target[it.key()] = it.value();
    }
}

void ContextEngine::merge_set_once(const FieldSpec& spec, Value& target, const Value& source) {
    if (target.is_null() || target == spec.identity || target == source) {
        target = source;
        return;
    }
    throw StateMergeError("Field '" + spec.name + "' is set-once and already holds " + target.dump());
}

} // namespace researchflow
