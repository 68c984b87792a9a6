/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <set>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/optional.hpp>

#include "common/outcome.hpp"
#include "fsm/error.hpp"

/**
 * The namespace is related to a generic implementation of a finite state
 * machine
 */
namespace datex::fsm {

  /**
   * Container for state transitions caused by an event
   *
   * Initialization methods of the class could arise exceptions.
   * This is designed behavior due to the nature of further way of use.
   *
   * Initialization has to be done via
   * sequential calling from* and to* methods.
   *
   * @tparam EventEnumType - enum class with events listed
   * @tparam EventContextType - data passed along with an event
   * @tparam StateEnumType - enum class with states listed
   * @tparam Entity - type of entity the transitions are applied to
   */
  template <typename EventEnumType,
            typename EventContextType,
            typename StateEnumType,
            typename Entity>
  class Transition final {
   public:
    /// Type alias for callback on state transition if set
    using ActionFunction =
        std::function<void(Entity & /* entity */,
                           EventEnumType /* event that caused transition */,
                           const EventContextType & /* event context */,
                           StateEnumType /* transition source state */,
                           StateEnumType /* transition destination state */)>;

    /// Constructs transition map container for the \param event
    explicit Transition(EventEnumType event) : event_{event} {}

    /// Set source state for a transition
    Transition &from(StateEnumType from_state) {
      if (from_any_ or not intermediary_.empty()) {
        throw std::runtime_error(
            "Event transition source state redefinition or destination state "
            "was not set.");
      }
      intermediary_.insert(from_state);
      return *this;
    }

    /// Set a list of source states for a transition
    template <typename... States>
    Transition &fromMany(States... states) {
      if (from_any_ or not intermediary_.empty()) {
        throw std::runtime_error(
            "Event transition source state redefinition or destination state "
            "was not set.");
      }
      (intermediary_.insert(states), ...);
      return *this;
    }

    /// Enable transition from any state
    Transition &fromAny() {
      if (from_any_ or not transitions_.empty() or not intermediary_.empty()) {
        throw std::runtime_error(
            "Event transition source state redefinition or destination state "
            "was not set.");
      }
      from_any_ = true;
      return *this;
    }

    /// Set destination state of a transition
    Transition &to(StateEnumType to_state) {
      if (from_any_) {
        if (any_destination_) {
          throw std::runtime_error(
              "Event transition destination state redefinition.");
        }
        any_destination_ = to_state;
        return *this;
      }
      if (intermediary_.empty()) {
        throw std::runtime_error(
            "Event transition source state(s) are not set.");
      }
      for (auto from : intermediary_) {
        if (not transitions_.emplace(from, to_state).second) {
          throw std::runtime_error(
              "Event transition source state redefinition.");
        }
      }
      intermediary_.clear();
      return *this;
    }

    /**
     * Set a callback to be called when state transition happens
     * @param callback - a function that takes the entity, the event, the
     * event context, transition source and destination states
     * @return self
     */
    Transition &action(ActionFunction callback) {
      if (transition_action_) {
        throw std::runtime_error("Transition callback is already set.");
      }
      transition_action_ = std::move(callback);
      return *this;
    }

    /// Getter for event identifier
    EventEnumType eventId() const {
      return event_;
    }

    /**
     * Lookups if there is a transition for a given source state.
     * @param from_state - transition source state
     * @return resulting state if there is a transition rule
     */
    boost::optional<StateEnumType> destination(StateEnumType from_state) const {
      if (from_any_) {
        return any_destination_;
      }
      auto lookup = transitions_.find(from_state);
      if (transitions_.end() == lookup) {
        return boost::none;
      }
      return lookup->second;
    }

    /// Calls transition callback if set
    void act(Entity &entity,
             const EventContextType &context,
             StateEnumType from_state,
             StateEnumType to_state) const {
      if (transition_action_) {
        transition_action_.get()(entity, event_, context, from_state, to_state);
      }
    }

   private:
    EventEnumType event_;
    bool from_any_{false};
    boost::optional<StateEnumType> any_destination_;
    std::unordered_map<StateEnumType, StateEnumType>
        transitions_;
    std::set<StateEnumType> intermediary_;
    boost::optional<ActionFunction> transition_action_;
  };

  /**
   * Synchronous finite state machine. The state is kept by the entity owner,
   * the machine only decides and applies transitions, so an event is either
   * applied completely or rejected without side effects.
   * @tparam EventEnumType - enum class with list of events
   * @tparam EventContextType - data passed along with an event
   * @tparam StateEnumType - enum class with list of states
   * @tparam Entity - type of handled objects
   */
  template <typename EventEnumType,
            typename EventContextType,
            typename StateEnumType,
            typename Entity>
  class FSM {
   public:
    using TransitionRule =
        Transition<EventEnumType, EventContextType, StateEnumType, Entity>;
    using ActionFunction = typename TransitionRule::ActionFunction;

    /**
     * Creates a state machine
     * @param transition_rules - defines state transitions, several rules for
     * the same event with different source states are allowed
     */
    explicit FSM(std::vector<TransitionRule> transition_rules) {
      for (auto &rule : transition_rules) {
        auto event = rule.eventId();
        transitions_.emplace(event, std::move(rule));
      }
    }

    /**
     * Finds destination state without applying anything
     * @param from_state - current state of an entity
     * @param event - event to check
     * @return destination state or FsmError
     */
    outcome::result<StateEnumType> check(StateEnumType from_state,
                                         EventEnumType event) const {
      OUTCOME_TRY(rule, findRule(from_state, event));
      return rule.second;
    }

    /**
     * Applies event to the entity
     * @param entity - entity to modify by actions
     * @param from_state - current state of the entity
     * @param event - event to apply
     * @param context - event data passed to actions
     * @return destination state or FsmError
     */
    outcome::result<StateEnumType> dispatch(Entity &entity,
                                            StateEnumType from_state,
                                            EventEnumType event,
                                            const EventContextType &context) const {
      OUTCOME_TRY(rule, findRule(from_state, event));
      rule.first->act(entity, context, from_state, rule.second);
      if (any_change_cb_) {
        any_change_cb_.get()(entity, event, context, from_state, rule.second);
      }
      return rule.second;
    }

    /// True if no event leads out of the state
    bool isFinal(StateEnumType state) const {
      for (const auto &it : transitions_) {
        if (it.second.destination(state)) {
          return false;
        }
      }
      return true;
    }

    /**
     * Optional. Sets a callback to call on any state transition.
     *
     * It will be called after a specific for the transition callback (if it was
     * set).
     */
    void setAnyChangeAction(ActionFunction action) {
      any_change_cb_ = std::move(action);
    }

   private:
    outcome::result<std::pair<const TransitionRule *, StateEnumType>> findRule(
        StateEnumType from_state, EventEnumType event) const {
      auto range = transitions_.equal_range(event);
      if (range.first == range.second) {
        return FsmError::kUnknownEvent;
      }
      for (auto it = range.first; it != range.second; ++it) {
        if (auto to_state = it->second.destination(from_state)) {
          return std::make_pair(&it->second, *to_state);
        }
      }
      return FsmError::kTransitionNotAllowed;
    }

    /// a dispatching list of events and what to do on event
    std::unordered_multimap<EventEnumType, TransitionRule>
        transitions_;

    /// optional callback for any transition
    boost::optional<ActionFunction> any_change_cb_;
  };

}  // namespace datex::fsm
