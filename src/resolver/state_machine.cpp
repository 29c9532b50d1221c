// beacon/src/resolver/state_machine.cpp
#include "beacon/resolver/state_machine.hpp"

namespace beacon::resolver {

std::string to_string(ResolverState state) {
    switch (state) {
        case ResolverState::STOPPED:
            return "stopped";
        case ResolverState::STARTING:
            return "starting";
        case ResolverState::RUNNING:
            return "running";
        case ResolverState::FAILED:
            return "failed";
        case ResolverState::STOPPING:
            return "stopping";
    }
    return "unknown";
}

std::string to_string(ResolverEvent event) {
    switch (event) {
        case ResolverEvent::START_ASSERTED:
            return "startAsserted";
        case ResolverEvent::FETCH_SUCCEEDED:
            return "fetchSucceeded";
        case ResolverEvent::FETCH_FAILED:
            return "fetchFailed";
        case ResolverEvent::STOP_ASSERTED:
            return "stopAsserted";
        case ResolverEvent::DRAINED:
            return "drained";
    }
    return "unknown";
}

std::string to_string(TransitionAction action) {
    switch (action) {
        case TransitionAction::NONE:
            return "none";
        case TransitionAction::BEGIN_INITIAL_FETCH:
            return "begin_initial_fetch";
        case TransitionAction::ENTER_RUNNING:
            return "enter_running";
        case TransitionAction::ENTER_FAILED:
            return "enter_failed";
        case TransitionAction::RECONCILE:
            return "reconcile";
        case TransitionAction::KEEP_POLLING:
            return "keep_polling";
        case TransitionAction::DRAIN:
            return "drain";
    }
    return "unknown";
}

InvalidTransition::InvalidTransition(ResolverState state, ResolverEvent event)
    : std::logic_error("no transition for " + to_string(event) +
                       " in state " + to_string(state)),
      _state(state) {}

InvalidTransition::InvalidTransition(ResolverState state,
                                     const std::string& what)
    : std::logic_error(what + " (state " + to_string(state) + ")"),
      _state(state) {}

const std::vector<Transition>& StateMachine::table() {
    using S = ResolverState;
    using E = ResolverEvent;
    using A = TransitionAction;
    static const std::vector<Transition> transitions = {
        {S::STOPPED, E::START_ASSERTED, A::BEGIN_INITIAL_FETCH, S::STARTING},
        {S::STARTING, E::FETCH_SUCCEEDED, A::ENTER_RUNNING, S::RUNNING},
        {S::STARTING, E::FETCH_FAILED, A::ENTER_FAILED, S::FAILED},
        {S::RUNNING, E::FETCH_SUCCEEDED, A::RECONCILE, S::RUNNING},
        {S::RUNNING, E::FETCH_FAILED, A::KEEP_POLLING, S::RUNNING},
        {S::RUNNING, E::STOP_ASSERTED, A::DRAIN, S::STOPPING},
        {S::FAILED, E::FETCH_SUCCEEDED, A::ENTER_RUNNING, S::RUNNING},
        {S::FAILED, E::FETCH_FAILED, A::KEEP_POLLING, S::FAILED},
        {S::FAILED, E::STOP_ASSERTED, A::DRAIN, S::STOPPING},
        {S::STOPPING, E::DRAINED, A::NONE, S::STOPPED},
    };
    return transitions;
}

const Transition* StateMachine::find(ResolverState state,
                                     ResolverEvent event) {
    for (const auto& transition : table()) {
        if (transition.from == state && transition.event == event) {
            return &transition;
        }
    }
    return nullptr;
}

bool StateMachine::accepts(ResolverEvent event) const {
    return find(_state, event) != nullptr;
}

const Transition& StateMachine::fire(ResolverEvent event) {
    const Transition* transition = find(_state, event);
    if (transition == nullptr) {
        throw InvalidTransition(_state, event);
    }
    _state = transition->to;
    return *transition;
}

}  // namespace beacon::resolver
