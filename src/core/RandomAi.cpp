//
// Created by Malik T on 18/08/2025.
//

#include "RandomAi.hpp"
#include <algorithm>
#include <random>
#include <ranges>

#include "Powers.hpp"

namespace manor::core
{
    RandomAI::RandomAI(std::uint64_t const rng_seed):
        rng_(static_cast<std::mt19937::result_type>(rng_seed)) {}

    auto RandomAI::Play(SessionView const& view, PlyrIdxT const me, RoomCatalog const& catalog, Config const& cfg)
        -> std::optional<PlayerAction>
    {
        if (!view.started || view.phase == Phase::GameOver) return std::nullopt;
        if (me >= view.players.size()) return std::nullopt;

        PlayerView const& self = view.players[me];
        if (self.eliminated) return std::nullopt;

        // use the revival item as soon as someone lies in our room
        if (self.role == Role::Survivor && self.carries_revival_item && self.current_room)
        {
            for (PlyrIdxT const v : view.rooms[*self.current_room].eliminated_here)
            {
                if (view.players[v].eliminated) return UseRevivalItemAction{v};
            }
        }

        bool const pending = std::ranges::any_of(view.pending_actions,
                                                 [me](PendingView const& p) { return p.player == me; });

        if (self.role == Role::Survivor)
        {
            if (view.phase == Phase::SurvivorSelection && !pending) return RoomMove(view, self);
            return std::nullopt;
        }

        switch (view.phase)
        {
        case Phase::KillerPowerSelection:
            return PowerMove(view, me, catalog, cfg);
        case Phase::KillerSelection:
            if (!pending) return RoomMove(view, self);
            return std::nullopt;
        case Phase::RageSecondSelection:
            if (std::ranges::find(view.second_chance_pending, me) != std::cend(view.second_chance_pending))
                return RoomMove(view, self);
            return std::nullopt;
        default:
            return std::nullopt;
        }
    }

    auto RandomAI::RoomMove(SessionView const& view, PlayerView const& self) -> std::optional<PlayerAction>
    {
        if (self.immobilized_next_turn && self.current_room)
            return SelectRoomAction{*self.current_room};

        std::vector<RoomIdxT> open;
        for (RoomView const& r : view.rooms)
        {
            if (!r.locked) open.push_back(r.index);
        }
        if (open.empty()) return std::nullopt;
        return SelectRoomAction{open[pick(open)]};
    }

    auto RandomAI::PowerMove(SessionView const& view, PlyrIdxT const me, RoomCatalog const& catalog, Config const& cfg)
        -> std::optional<PlayerAction>
    {
        auto const it = std::ranges::find_if(view.power_selections,
                                             [me](PowerSelectionView const& s) { return s.player == me; });
        if (it == std::cend(view.power_selections) || it->complete) return std::nullopt;

        if (!it->selected)
        {
            if (it->options.empty()) return std::nullopt;
            return SelectPowerAction{it->options[pick(it->options)]};
        }
        return PowerTargetAction{TargetFor(*it->selected, catalog, cfg)};
    }

    auto RandomAI::TargetFor(PowerKind const power, RoomCatalog const& catalog, Config const& cfg) -> PowerTarget
    {
        PowerEffect const& effect = PowerCatalog::Instance().Get(power);
        PowerTarget t{};

        switch (effect.Def().targeting)
        {
        case TargetingKind::None:
            break;

        case TargetingKind::SingleRoom:
            t.rooms.push_back(static_cast<RoomIdxT>(
                std::uniform_int_distribution<std::size_t>{0, catalog.RoomCount() - 1}(rng_)));
            break;

        case TargetingKind::RoomSet:
        {
            std::vector<RoomIdxT> all(catalog.RoomCount());
            for (std::size_t i{}; i < all.size(); ++i) all[i] = static_cast<RoomIdxT>(i);
            std::ranges::shuffle(all, rng_);

            std::size_t const max = std::min<std::size_t>(effect.MaxRooms(cfg), all.size());
            std::size_t const n = std::uniform_int_distribution<std::size_t>{1, max}(rng_);
            t.rooms.assign(all.begin(), all.begin() + static_cast<std::ptrdiff_t>(n));
            break;
        }

        case TargetingKind::OnePerFloor:
            for (std::size_t f{}; f < catalog.FloorCount(); ++f)
            {
                auto const rooms = catalog.RoomsOnFloor(static_cast<FloorIdxT>(f));
                t.rooms.push_back(rooms[pick(rooms)]);
            }
            break;

        case TargetingKind::OneFloor:
            t.floor = static_cast<FloorIdxT>(
                std::uniform_int_distribution<std::size_t>{0, catalog.FloorCount() - 1}(rng_));
            break;
        }
        return t;
    }
}
