#pragma once

#include <string>

#include "core/model/AllocationTypes.h"

namespace capflow {
namespace core {
namespace execution {

enum class OpportunityEvent { VALIDATE, START, COMPLETE, FAIL, EXPIRE };

struct OpportunityTransitionResult {
    OpportunityState state = OpportunityState::PROPOSED;
    bool accepted = false;
    bool terminal = false;
};

// PROPOSED -> VALIDATED -> EXECUTING -> COMPLETED | FAILED | EXPIRED.
// FAIL is legal from every live state, EXPIRE only before execution starts.
// Terminal states accept nothing.
class OpportunityLifecycleStateMachine {
public:
    static OpportunityTransitionResult transition(OpportunityState current, OpportunityEvent event);

    // Journal/replay form: "validate", "start", "complete", "fail", "expire".
    static OpportunityTransitionResult transition(OpportunityState current, const std::string& event);
};

} // namespace execution
} // namespace core
} // namespace capflow
