//
// Created by Malik T on 20/08/2025.
//

#ifndef MANORGAME_AUDITLOGGER_HPP
#define MANORGAME_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/Session.hpp"
#include "../core/State.hpp"
#include "../core/Actions.hpp"
#include "../core/Types.hpp"

namespace manor::core::debug
{
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        // Session header (code, seed, roster)
        auto start(Session const& session, std::uint64_t seed) -> void;

        // Per submitted action (before Apply/Advance)
        auto action(Session const& session, PlyrIdxT actor, PlayerAction const& a) -> void;

        // Per submission outcome
        auto outcome(ActionOutcome m) -> void;

        // After a resolved turn: positions, gold, locks
        auto turn(Session const& session) -> void;

        // Game end footer (winner, turns played, event count)
        auto end(Session const& session) -> void;

        // Manual flush
        auto flush() -> void;

    private:
        std::ofstream out_;
    };
}

#endif //MANORGAME_AUDITLOGGER_HPP
