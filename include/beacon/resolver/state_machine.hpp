// beacon/include/beacon/resolver/state_machine.hpp
#pragma once

#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace beacon::resolver {

/// @brief Lifecycle states of a resolver.
enum class ResolverState {
    STOPPED,   // no polling, no advertised backends
    STARTING,  // initial fetch outstanding
    RUNNING,   // advertised set valid, polling on the interval
    FAILED,    // initial fetch failed, retrying on the interval
    STOPPING   // retracting every advertised backend
};

/// @brief Inputs of the lifecycle state machine.
enum class ResolverEvent {
    START_ASSERTED,
    FETCH_SUCCEEDED,
    FETCH_FAILED,
    STOP_ASSERTED,
    DRAINED
};

/// @brief What the owner must do after a transition has been taken.
enum class TransitionAction {
    NONE,
    BEGIN_INITIAL_FETCH,  // issue one fetch outside the poll timer
    ENTER_RUNNING,        // stop the timer, reconcile, restart the timer
    ENTER_FAILED,         // start the retry timer
    RECONCILE,            // reconcile the latest result, keep polling
    KEEP_POLLING,         // a poll failed; leave the advertised set alone
    DRAIN                 // cancel polling and retract everything
};

struct Transition {
    ResolverState from;
    ResolverEvent event;
    TransitionAction action;
    ResolverState to;
};

std::string to_string(ResolverState state);
std::string to_string(ResolverEvent event);
std::string to_string(TransitionAction action);

inline std::ostream& operator<<(std::ostream& os, ResolverState state) {
    return os << to_string(state);
}
inline std::ostream& operator<<(std::ostream& os, ResolverEvent event) {
    return os << to_string(event);
}

/// @brief Raised when an event has no transition from the current state,
/// e.g. stop() on a stopped resolver.
class InvalidTransition : public std::logic_error {
public:
    InvalidTransition(ResolverState state, ResolverEvent event);
    InvalidTransition(ResolverState state, const std::string& what);

    ResolverState state() const { return _state; }

private:
    ResolverState _state;
};

/// @brief Table driven lifecycle. Holds the current state and nothing else;
/// side effects belong to the owner, which acts on the returned Transition.
class StateMachine {
public:
    explicit StateMachine(ResolverState initial = ResolverState::STOPPED)
        : _state(initial) {}

    ResolverState state() const { return _state; }
    bool is_in_state(ResolverState state) const { return _state == state; }

    /// @brief True if `event` has a transition from the current state.
    bool accepts(ResolverEvent event) const;

    /// @brief Takes the transition for `event` and returns it.
    /// @throws InvalidTransition if there is none.
    const Transition& fire(ResolverEvent event);

    /// @brief The complete (state, event) -> (action, next state) table.
    static const std::vector<Transition>& table();

private:
    static const Transition* find(ResolverState state, ResolverEvent event);

    ResolverState _state;
};

}  // namespace beacon::resolver
