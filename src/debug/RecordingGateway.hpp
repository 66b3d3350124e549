//
// Created by Malik T on 08/11/2025.
//

#ifndef MANORGAME_RECORDINGGATEWAY_HPP
#define MANORGAME_RECORDINGGATEWAY_HPP

#include <chrono>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "../core/Gateway.hpp"
#include "../core/Session.hpp"

namespace manor::core::debug
{
    // Gateway that keeps every batch it was handed, with the views a real transport
    // would have encoded at that moment.
    class RecordingGateway final : public BroadcastGateway
    {
    public:
        struct Batch
        {
            std::vector<Broadcast> items;
            std::uint32_t turn{};
            Phase phase{};
            SessionView survivor_view;
            SessionView killer_view;
            std::thread::id thread;
            std::chrono::steady_clock::time_point begin;
            std::chrono::steady_clock::time_point end;
        };

        RecordingGateway() = default;
        // Slows every delivery down, to make overlapping deliveries observable.
        explicit RecordingGateway(std::chrono::milliseconds delay) : delay_(delay) {}

        auto Deliver(Session const& session, std::span<Broadcast const> batch) -> void override
        {
            Batch b;
            b.begin = std::chrono::steady_clock::now();
            b.items.assign(batch.begin(), batch.end());
            b.turn = session.Turn();
            b.phase = session.PhaseNow();
            b.survivor_view = session.ViewFor(Role::Survivor);
            b.killer_view = session.ViewFor(Role::Killer);
            b.thread = std::this_thread::get_id();
            if (delay_.count() > 0) std::this_thread::sleep_for(delay_);
            b.end = std::chrono::steady_clock::now();

            std::lock_guard<std::mutex> lock(m_);
            batches_.push_back(std::move(b));
        }

        auto Batches() const -> std::vector<Batch>
        {
            std::lock_guard<std::mutex> lock(m_);
            return batches_;
        }

        auto Size() const -> std::size_t
        {
            std::lock_guard<std::mutex> lock(m_);
            return batches_.size();
        }

    private:
        std::chrono::milliseconds delay_{0};
        mutable std::mutex m_;
        std::vector<Batch> batches_;
    };

    // Whether `b` is addressed to `player`, directly or through its role.
    inline auto ReachedPlayer(Broadcast const& b, PlyrIdxT player, Role role) -> bool
    {
        return std::visit([&]<typename T0>(T0 const& a) -> bool
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, AudienceAll>) return true;
            else if constexpr (std::is_same_v<T, AudienceRole>) return a.role == role;
            else return a.player == player;
        }, b.audience);
    }
}

#endif //MANORGAME_RECORDINGGATEWAY_HPP
