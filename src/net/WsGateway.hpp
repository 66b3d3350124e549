//
// Created by Malik T on 09/11/2025.
//

#ifndef MANORGAME_WSGATEWAY_HPP
#define MANORGAME_WSGATEWAY_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <flatbuffers/flatbuffers.h>
#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "core/Gateway.hpp"
#include "core/Session.hpp"
#include "core/Types.hpp"

namespace manor::net
{
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using Hdl      = websocketpp::connection_hdl;

    struct Seat
    {
        std::string code;
        core::PlyrIdxT player{};
    };

    class WsGateway final : public core::BroadcastGateway
    {
    public:
        // One binary frame to one connection.
        using SendFn = std::function<websocketpp::lib::error_code(Hdl const&, std::span<std::byte const>)>;

        explicit WsGateway(SendFn send);

        // Binary sends through a running endpoint.
        static auto SendVia(WsServer& server) -> SendFn;

        // Binds `hdl` to a player seat. An older connection on the same seat is unbound.
        auto Attach(std::string const& code, core::PlyrIdxT player, Hdl hdl) -> void;
        auto Detach(Hdl const& hdl) -> std::optional<Seat>;
        auto Lookup(Hdl const& hdl) const -> std::optional<Seat>;
        auto IsAttached(std::string const& code, core::PlyrIdxT player) const -> bool;
        auto ConnectionCount() const -> std::size_t;

        // Unsolicited frame outside any session batch (welcome, decode errors).
        auto SendTo(Hdl const& hdl, flatbuffers::DetachedBuffer const& buf) -> bool;

        auto Deliver(core::Session const& session, std::span<core::Broadcast const> batch) -> void override;

        auto NextMsgId() noexcept -> std::uint64_t { return next_msg_id_.fetch_add(1); }

    private:
        auto Send(Hdl const& hdl, flatbuffers::DetachedBuffer const& buf) -> websocketpp::lib::error_code;
        auto SessionConnections(std::string const& code) const -> std::vector<std::pair<core::PlyrIdxT, Hdl>>;

    private:
        SendFn send_;
        std::atomic<std::uint64_t> next_msg_id_{1};

        mutable std::mutex m_;
        std::map<std::pair<std::string, core::PlyrIdxT>, Hdl> by_seat_;
        std::map<Hdl, Seat, std::owner_less<Hdl>> by_hdl_;
    };
}

#endif //MANORGAME_WSGATEWAY_HPP
