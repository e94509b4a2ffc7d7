#include "core/execution/OpportunityLifecycleStateMachine.h"

#include <algorithm>
#include <cctype>

namespace capflow {
namespace core {
namespace execution {

namespace {
std::string normalizeEvent(std::string event) {
    std::transform(event.begin(), event.end(), event.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return event;
}

OpportunityTransitionResult accept(OpportunityState next) {
    OpportunityTransitionResult result;
    result.state = next;
    result.accepted = true;
    result.terminal = isTerminalState(next);
    return result;
}

OpportunityTransitionResult reject(OpportunityState current) {
    OpportunityTransitionResult result;
    result.state = current;
    result.accepted = false;
    result.terminal = isTerminalState(current);
    return result;
}
} // namespace

OpportunityTransitionResult OpportunityLifecycleStateMachine::transition(
    OpportunityState current,
    OpportunityEvent event
) {
    switch (current) {
        case OpportunityState::PROPOSED:
            if (event == OpportunityEvent::VALIDATE) return accept(OpportunityState::VALIDATED);
            if (event == OpportunityEvent::FAIL) return accept(OpportunityState::FAILED);
            if (event == OpportunityEvent::EXPIRE) return accept(OpportunityState::EXPIRED);
            break;
        case OpportunityState::VALIDATED:
            if (event == OpportunityEvent::START) return accept(OpportunityState::EXECUTING);
            if (event == OpportunityEvent::FAIL) return accept(OpportunityState::FAILED);
            if (event == OpportunityEvent::EXPIRE) return accept(OpportunityState::EXPIRED);
            break;
        case OpportunityState::EXECUTING:
            if (event == OpportunityEvent::COMPLETE) return accept(OpportunityState::COMPLETED);
            if (event == OpportunityEvent::FAIL) return accept(OpportunityState::FAILED);
            break;
        case OpportunityState::COMPLETED:
        case OpportunityState::FAILED:
        case OpportunityState::EXPIRED:
            break;
    }
    return reject(current);
}

OpportunityTransitionResult OpportunityLifecycleStateMachine::transition(
    OpportunityState current,
    const std::string& event
) {
    const std::string normalized_event = normalizeEvent(event);
    if (normalized_event == "validate" || normalized_event == "validated") {
        return transition(current, OpportunityEvent::VALIDATE);
    }
    if (normalized_event == "start" || normalized_event == "executing") {
        return transition(current, OpportunityEvent::START);
    }
    if (normalized_event == "complete" || normalized_event == "completed") {
        return transition(current, OpportunityEvent::COMPLETE);
    }
    if (normalized_event == "fail" || normalized_event == "failed") {
        return transition(current, OpportunityEvent::FAIL);
    }
    if (normalized_event == "expire" || normalized_event == "expired") {
        return transition(current, OpportunityEvent::EXPIRE);
    }
    return reject(current);
}

} // namespace execution
} // namespace core
} // namespace capflow
