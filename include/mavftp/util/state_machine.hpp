#pragma once

#include "../core/error.hpp"
#include "event.hpp"
#include <datapod/datapod.hpp>

namespace mavftp {
    namespace util {

        // ─── State holder with absorbing states ──────────────────────────────────────
        // Once the machine reaches a state listed as terminal it refuses every
        // further transition.
        template <typename StateEnum> class StateMachine {
            StateEnum state_;
            dp::Vector<StateEnum> terminal_;

          public:
            explicit StateMachine(StateEnum initial, dp::Vector<StateEnum> terminal = {})
                : state_(initial), terminal_(std::move(terminal)) {}

            StateEnum state() const noexcept { return state_; }
            bool is(StateEnum s) const noexcept { return state_ == s; }

            bool is_terminal() const noexcept {
                for (auto s : terminal_) {
                    if (s == state_)
                        return true;
                }
                return false;
            }

            Result<void> transition(StateEnum next) {
                if (next == state_)
                    return {};
                if (is_terminal()) {
                    return Result<void>::err(Error::invalid_state("transition out of terminal state"));
                }
                StateEnum old = state_;
                state_ = next;
                on_transition.emit(old, next);
                return {};
            }

            Event<StateEnum, StateEnum> on_transition; // (from, to)
        };

    } // namespace util
    using namespace util;
} // namespace mavftp
