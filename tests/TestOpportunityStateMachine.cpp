#include "core/execution/OpportunityLifecycleStateMachine.h"

#include <cassert>
#include <iostream>

using capflow::core::OpportunityState;
using capflow::core::execution::OpportunityEvent;
using capflow::core::execution::OpportunityLifecycleStateMachine;

int main() {
    {
        auto r = OpportunityLifecycleStateMachine::transition(OpportunityState::PROPOSED, OpportunityEvent::VALIDATE);
        assert(r.accepted);
        assert(r.state == OpportunityState::VALIDATED);
        assert(!r.terminal);
    }

    {
        auto r = OpportunityLifecycleStateMachine::transition(OpportunityState::VALIDATED, OpportunityEvent::START);
        assert(r.accepted);
        assert(r.state == OpportunityState::EXECUTING);
    }

    {
        auto r = OpportunityLifecycleStateMachine::transition(OpportunityState::EXECUTING, OpportunityEvent::COMPLETE);
        assert(r.accepted);
        assert(r.state == OpportunityState::COMPLETED);
        assert(r.terminal);
    }

    {
        auto r = OpportunityLifecycleStateMachine::transition(OpportunityState::PROPOSED, OpportunityEvent::EXPIRE);
        assert(r.accepted);
        assert(r.state == OpportunityState::EXPIRED);
        assert(r.terminal);
    }

    // Execution in flight cannot expire, only complete or fail.
    {
        auto r = OpportunityLifecycleStateMachine::transition(OpportunityState::EXECUTING, OpportunityEvent::EXPIRE);
        assert(!r.accepted);
        assert(r.state == OpportunityState::EXECUTING);

        auto failed = OpportunityLifecycleStateMachine::transition(OpportunityState::EXECUTING, OpportunityEvent::FAIL);
        assert(failed.accepted);
        assert(failed.state == OpportunityState::FAILED);
    }

    // No skipping ahead, no leaving a terminal state.
    {
        assert(!OpportunityLifecycleStateMachine::transition(OpportunityState::PROPOSED, OpportunityEvent::START).accepted);
        assert(!OpportunityLifecycleStateMachine::transition(OpportunityState::PROPOSED, OpportunityEvent::COMPLETE).accepted);
        for (auto terminal : {OpportunityState::COMPLETED, OpportunityState::FAILED, OpportunityState::EXPIRED}) {
            for (auto event : {OpportunityEvent::VALIDATE, OpportunityEvent::START, OpportunityEvent::COMPLETE,
                               OpportunityEvent::FAIL, OpportunityEvent::EXPIRE}) {
                auto r = OpportunityLifecycleStateMachine::transition(terminal, event);
                assert(!r.accepted);
                assert(r.state == terminal);
                assert(r.terminal);
            }
        }
    }

    // Journal spelling.
    {
        auto r = OpportunityLifecycleStateMachine::transition(OpportunityState::VALIDATED, "Failed");
        assert(r.accepted);
        assert(r.state == OpportunityState::FAILED);
        assert(!OpportunityLifecycleStateMachine::transition(OpportunityState::PROPOSED, "cancel").accepted);
    }

    std::cout << "[TEST] OpportunityStateMachine PASSED\n";
    return 0;
}
