//
// Created by Malik T on 04/11/2025.
//
#include "Outbound.hpp"

namespace manor::core
{
    auto Outbox::Event(EventKind const kind, std::string message, std::optional<Role> const for_role) -> void
    {
        Audience audience = for_role ? Audience{AudienceRole{*for_role}} : Audience{AudienceAll{}};
        out_.push_back(Broadcast{audience, Notice{.kind = NoticeKind::Event, .text = message}});
        state_.events.push_back(GameEvent{
            .turn = state_.turn, .kind = kind, .message = std::move(message), .for_role = for_role});
    }

    auto Outbox::Notify(Audience audience, Notice notice) -> void
    {
        out_.push_back(Broadcast{audience, std::move(notice)});
    }

    auto Outbox::Notify(Audience audience, NoticeKind const kind, std::string text) -> void
    {
        Notify(audience, Notice{.kind = kind, .text = std::move(text)});
    }

    auto Outbox::Reject(PlyrIdxT const player, error::RuleViolation const& v) -> void
    {
        out_.push_back(Broadcast{AudiencePlayer{player}, Violation{v}});
    }

    auto Outbox::Reject(PlyrIdxT const player, error::LobbyError const& e) -> void
    {
        out_.push_back(Broadcast{AudiencePlayer{player}, Rejection{e}});
    }

    auto Outbox::StateChanged() -> void
    {
        out_.push_back(Broadcast{AudienceAll{}, StateUpdate{}});
    }

    auto Outbox::StateChangedFor(PlyrIdxT const player) -> void
    {
        out_.push_back(Broadcast{AudiencePlayer{player}, StateUpdate{}});
    }
}
