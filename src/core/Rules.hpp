//
// Created by Malik T on 06/11/2025.
//

#ifndef MANORGAME_RULES_HPP
#define MANORGAME_RULES_HPP

#include "Actions.hpp"
#include "Types.hpp"
#include "Exception.hpp"

namespace manor::core
{
    //forward declaration
    class Session;

    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Throw only for engine misuse / broken invariants.
        virtual auto Validate(Session const& session, PlyrIdxT actor, PlayerAction const& a) const -> CheckResult = 0;

        // Records the action on the authoritative state.
        virtual auto Apply(Session& session, PlyrIdxT actor, PlayerAction const& a) -> void = 0;

        // Moves the phase machine forward as far as the collected actions allow.
        virtual auto Advance(Session& session) -> ActionOutcome = 0;

        // Fresh game on the current roster; called by Session::Start.
        virtual auto Begin(Session& session) -> void = 0;
    };
}

#endif //MANORGAME_RULES_HPP
