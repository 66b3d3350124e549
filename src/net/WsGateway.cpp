//
// WsGateway.cpp
//
#include "WsGateway.hpp"

#include <array>
#include <fmt/format.h>

#include "net/codec.hpp"

namespace manor::net
{
    namespace
    {
        auto Reaches(core::Audience const& audience, core::PlyrIdxT const player, core::Role const role) -> bool
        {
            return std::visit([&]<typename T0>(T0 const& a) -> bool
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, core::AudienceAll>) return true;
                else if constexpr (std::is_same_v<T, core::AudienceRole>) return a.role == role;
                else return a.player == player;
            }, audience);
        }
    } // anon

    WsGateway::WsGateway(SendFn send) : send_(std::move(send))
    {
        MNR_ASSERT(static_cast<bool>(send_), "WsGateway needs a send function");
    }

    auto WsGateway::SendVia(WsServer& server) -> SendFn
    {
        return [&server](Hdl const& hdl, std::span<std::byte const> bytes) -> websocketpp::lib::error_code
        {
            websocketpp::lib::error_code ec;
            server.send(hdl,
                        reinterpret_cast<void const*>(bytes.data()),
                        bytes.size(),
                        websocketpp::frame::opcode::binary,
                        ec);
            return ec;
        };
    }

    auto WsGateway::Attach(std::string const& code, core::PlyrIdxT const player, Hdl hdl) -> void
    {
        std::lock_guard<std::mutex> lock(m_);

        // A connection belongs to one seat at a time.
        if (auto old = by_hdl_.find(hdl); old != by_hdl_.end())
        {
            by_seat_.erase({old->second.code, old->second.player});
            by_hdl_.erase(old);
        }

        auto const key = std::make_pair(code, player);
        if (auto prev = by_seat_.find(key); prev != by_seat_.end())
        {
            by_hdl_.erase(prev->second);
            by_seat_.erase(prev);
        }

        by_seat_.emplace(key, hdl);
        by_hdl_.emplace(std::move(hdl), Seat{code, player});
    }

    auto WsGateway::Detach(Hdl const& hdl) -> std::optional<Seat>
    {
        std::lock_guard<std::mutex> lock(m_);
        auto it = by_hdl_.find(hdl);
        if (it == by_hdl_.end()) return std::nullopt;

        Seat seat = std::move(it->second);
        by_hdl_.erase(it);
        by_seat_.erase({seat.code, seat.player});
        return seat;
    }

    auto WsGateway::Lookup(Hdl const& hdl) const -> std::optional<Seat>
    {
        std::lock_guard<std::mutex> lock(m_);
        auto it = by_hdl_.find(hdl);
        if (it == by_hdl_.end()) return std::nullopt;
        return it->second;
    }

    auto WsGateway::IsAttached(std::string const& code, core::PlyrIdxT const player) const -> bool
    {
        std::lock_guard<std::mutex> lock(m_);
        return by_seat_.contains({code, player});
    }

    auto WsGateway::ConnectionCount() const -> std::size_t
    {
        std::lock_guard<std::mutex> lock(m_);
        return by_hdl_.size();
    }

    auto WsGateway::SendTo(Hdl const& hdl, flatbuffers::DetachedBuffer const& buf) -> bool
    {
        websocketpp::lib::error_code const ec = Send(hdl, buf);
        if (ec)
        {
            fmt::print(stderr, "[manord] send failed: {}\n", ec.message());
            return false;
        }
        return true;
    }

    auto WsGateway::Send(Hdl const& hdl, flatbuffers::DetachedBuffer const& buf) -> websocketpp::lib::error_code
    {
        std::span<std::byte const> const bytes{reinterpret_cast<std::byte const*>(buf.data()), buf.size()};
        return send_(hdl, bytes);
    }

    auto WsGateway::SessionConnections(std::string const& code) const
        -> std::vector<std::pair<core::PlyrIdxT, Hdl>>
    {
        std::vector<std::pair<core::PlyrIdxT, Hdl>> out;
        std::lock_guard<std::mutex> lock(m_);
        for (auto it = by_seat_.lower_bound({code, 0}); it != by_seat_.end() && it->first.first == code; ++it)
            out.emplace_back(it->first.second, it->second);
        return out;
    }

    auto WsGateway::Deliver(core::Session const& session, std::span<core::Broadcast const> const batch) -> void
    {
        std::vector<std::pair<core::PlyrIdxT, Hdl>> const conns = SessionConnections(session.Code());
        if (conns.empty()) return;

        std::vector<core::Role> roles;
        roles.reserve(conns.size());
        for (auto const& [player, hdl] : conns) roles.push_back(session.RoleOf(player));

        // State is rendered once per role for the whole batch: every update in it describes
        // the state as it is now.
        std::array<std::optional<flatbuffers::DetachedBuffer>, 2> state_frames{};
        auto state_frame = [&](core::Role const role) -> flatbuffers::DetachedBuffer const&
        {
            std::optional<flatbuffers::DetachedBuffer>& slot = state_frames[static_cast<std::size_t>(role)];
            if (!slot)
            {
                core::SessionView const view = session.State().started ? session.ViewFor(role) : session.FullView();
                slot = core::net::BuildStateUpdate(view, session.Catalog(), NextMsgId());
            }
            return *slot;
        };

        std::vector<bool> dropped(conns.size(), false);

        for (core::Broadcast const& b : batch)
        {
            std::optional<flatbuffers::DetachedBuffer> shared;

            for (std::size_t i{}; i < conns.size(); ++i)
            {
                if (dropped[i]) continue;
                auto const& [player, hdl] = conns[i];
                if (!Reaches(b.audience, player, roles[i])) continue;

                flatbuffers::DetachedBuffer const* frame = std::visit(
                    [&]<typename T0>(T0 const& msg) -> flatbuffers::DetachedBuffer const*
                    {
                        using T = std::decay_t<T0>;
                        if constexpr (std::is_same_v<T, core::StateUpdate>)
                        {
                            return &state_frame(roles[i]);
                        }
                        else
                        {
                            if (!shared)
                            {
                                if constexpr (std::is_same_v<T, core::Notice>)
                                    shared = core::net::BuildNotice(msg, NextMsgId());
                                else if constexpr (std::is_same_v<T, core::Violation>)
                                    shared = core::net::BuildViolation(msg.violation, NextMsgId());
                                else
                                    shared = core::net::BuildRejected(msg.error, NextMsgId());
                            }
                            return &*shared;
                        }
                    }, b.message);

                if (websocketpp::lib::error_code const ec = Send(hdl, *frame))
                {
                    fmt::print(stderr, "[manord] session {} player {}: send failed ({}), dropping connection\n",
                               session.Code(), static_cast<int>(player), ec.message());
                    dropped[i] = true;
                }
            }
        }

        for (std::size_t i{}; i < conns.size(); ++i)
        {
            if (dropped[i]) Detach(conns[i].second);
        }
    }
}
