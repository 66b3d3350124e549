// File: src/ManorServerMain.cpp
//
// Allman style. Explicit types. No K&R.
//
// Authoritative manor server on WebSocket++ (no TLS). Hosts any number of sessions;
// a connection binds to one player seat through CreateSession, JoinSession or Attach,
// then every frame it sends is routed into that session's actor.

#include <charconv>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>

#include <fmt/format.h>
#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "core/Exception.hpp"
#include "core/Session.hpp"
#include "core/SessionActor.hpp"
#include "core/Types.hpp"
#include "net/SessionStore.hpp"
#include "net/WsGateway.hpp"
#include "net/codec.hpp"

namespace
{
    using manor::net::WsServer;
    using manor::net::Hdl;
    namespace core = manor::core;

    struct ServerConfig
    {
        std::uint16_t port{9002};
        std::optional<std::uint64_t> seed{};
        std::size_t max_players{core::constants::MaxPlayers};
        std::uint32_t gold_per_search{core::constants::GoldPerSearch};
        bool exclude_seen_powers{false};
    };

    template <typename T>
    auto ReadNumber(std::string_view const text, T& dst) -> bool
    {
        T value{};
        auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || ptr != text.data() + text.size()) return false;
        dst = value;
        return true;
    }

    auto ParseArgs(int argc, char** argv) -> ServerConfig
    {
        ServerConfig c{};
        for (int i = 1; i < argc; ++i)
        {
            std::string_view const key = argv[i];
            auto next = [&]() -> std::string_view
            {
                return i + 1 < argc ? std::string_view{argv[++i]} : std::string_view{};
            };

            bool ok = true;
            if (key == "--port") { ok = ReadNumber(next(), c.port); }
            else if (key == "--seed")
            {
                std::uint64_t seed{};
                ok = ReadNumber(next(), seed);
                if (ok) c.seed = seed;
            }
            else if (key == "--max-players") { ok = ReadNumber(next(), c.max_players); }
            else if (key == "--gold") { ok = ReadNumber(next(), c.gold_per_search); }
            else if (key == "--exclude-seen") { c.exclude_seen_powers = true; }
            else
            {
                fmt::print(stderr, "[manord] ignoring unknown option {}\n", key);
            }

            if (!ok) fmt::print(stderr, "[manord] bad value for {}, keeping default\n", key);
        }

        if (c.max_players < 2 || c.max_players > core::constants::MaxPlayers)
            c.max_players = core::constants::MaxPlayers;
        return c;
    }

    // Routes decoded client frames to the store (unbound connections) or to the
    // session actor of the seat the connection is bound to.
    class Router
    {
    public:
        Router(manor::net::SessionStore& store, manor::net::WsGateway& gateway) : store_(store), gateway_(gateway) {}

        auto OnFrame(Hdl const& hdl, std::span<std::byte const> bytes) -> void
        {
            auto decoded = core::net::DecodeClientMessage(bytes);
            if (!decoded)
            {
                fmt::print(stderr, "[manord] parse error: {}\n", decoded.error().message);
                return;
            }

            std::optional<manor::net::Seat> const seat = gateway_.Lookup(hdl);
            std::visit([&]<typename T0>(T0& req)
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, core::net::CreateSessionReq>
                    || std::is_same_v<T, core::net::JoinSessionReq>
                    || std::is_same_v<T, core::net::AttachReq>)
                {
                    if (seat)
                    {
                        fmt::print(stderr, "[manord] {} P{} tried to bind twice\n", seat->code,
                                   static_cast<int>(seat->player));
                        return;
                    }
                    Bind(hdl, req);
                }
                else
                {
                    if (!seat)
                    {
                        fmt::print(stderr, "[manord] frame from unbound connection ignored\n");
                        return;
                    }
                    Route(hdl, *seat, req);
                }
            }, decoded->request);
        }

        auto OnClose(Hdl const& hdl) -> void
        {
            std::optional<manor::net::Seat> const seat = gateway_.Detach(hdl);
            if (!seat) return;

            fmt::print("[manord] {} P{} disconnected\n", seat->code, static_cast<int>(seat->player));
            if (std::shared_ptr<core::SessionActor> actor = store_.Find(seat->code))
            {
                core::PlyrIdxT const p = seat->player;
                actor->Post([p](core::Session& s) { s.OnDisconnect(p); });
            }
        }

    private:
        auto Bind(Hdl const& hdl, core::net::CreateSessionReq& req) -> void
        {
            Welcome(hdl, store_.Create(std::move(req.profile), req.conspiracy_mode));
        }

        auto Bind(Hdl const& hdl, core::net::JoinSessionReq& req) -> void
        {
            Welcome(hdl, store_.Join(req.code, std::move(req.profile)));
        }

        auto Bind(Hdl const& hdl, core::net::AttachReq& req) -> void
        {
            std::shared_ptr<core::SessionActor> actor = store_.Authenticate(req.code, req.player, req.token);
            if (!actor)
            {
                Welcome(hdl, std::unexpected(core::error::lobby_error(core::error::LobbyErrorCode::UnknownPlayer)));
                return;
            }
            Welcome(hdl, manor::net::Membership{actor->Code(), req.player, req.token, actor});
        }

        auto Welcome(Hdl const& hdl, core::error::LobbyResult<manor::net::Membership> const& joined) -> void
        {
            if (!joined)
            {
                fmt::print(stderr, "[manord] lobby rejection: {}\n", joined.error().reason);
                gateway_.SendTo(hdl, core::net::BuildRejected(joined.error(), gateway_.NextMsgId()));
                return;
            }

            manor::net::Membership const& m = *joined;
            gateway_.Attach(m.code, m.player, hdl);
            if (!gateway_.SendTo(hdl, core::net::BuildWelcome(m.code, m.player, m.token, gateway_.NextMsgId())))
            {
                gateway_.Detach(hdl);
                return;
            }

            fmt::print("[manord] {} P{} connected\n", m.code, static_cast<int>(m.player));
            core::PlyrIdxT const p = m.player;
            m.actor->Post([p](core::Session& s) { s.OnConnect(p); });
        }

        auto Route(Hdl const& hdl, manor::net::Seat const& seat, auto& req) -> void
        {
            using T = std::decay_t<decltype(req)>;

            std::shared_ptr<core::SessionActor> actor = store_.Find(seat.code);
            if (!actor)
            {
                gateway_.Detach(hdl);
                return;
            }

            core::PlyrIdxT const p = seat.player;
            if constexpr (std::is_same_v<T, core::net::StartGameReq>)
            {
                actor->Post([p](core::Session& s)
                {
                    if (auto r = s.Start(); !r) s.Reject(p, r.error());
                });
            }
            else if constexpr (std::is_same_v<T, core::net::ResetGameReq>)
            {
                actor->Post([](core::Session& s) { s.Reset(); });
            }
            else if constexpr (std::is_same_v<T, core::net::ChangeRoleReq>)
            {
                actor->Post([p, req](core::Session& s)
                {
                    if (auto r = s.ChangeRole(p, req.role, req.player_class); !r) s.Reject(p, r.error());
                });
            }
            else
            {
                static_assert(std::is_same_v<T, core::net::GameActionReq>, "unhandled request");
                actor->Post([p, action = req.action](core::Session& s) { (void)s.Submit(p, action); });
            }
        }

    private:
        manor::net::SessionStore& store_;
        manor::net::WsGateway& gateway_;
    };
} // anon

int main(int argc, char** argv)
{
    ServerConfig const cfg = ParseArgs(argc, argv);

    core::Config base{};
    if (cfg.seed) base.seed = *cfg.seed;
    base.max_players = cfg.max_players;
    base.gold_per_search = cfg.gold_per_search;
    base.exclude_seen_powers = cfg.exclude_seen_powers;

    fmt::print("[manord] booting on port {} | max players {} | seed {}\n",
               cfg.port, cfg.max_players, base.seed);

    WsServer server;
    server.clear_access_channels(websocketpp::log::alevel::all);
    server.set_access_channels(websocketpp::log::alevel::connect |
        websocketpp::log::alevel::disconnect);
    server.init_asio();

    auto gateway = std::make_shared<manor::net::WsGateway>(manor::net::WsGateway::SendVia(server));
    manor::net::SessionStore store(base, gateway);
    Router router(store, *gateway);

    server.set_message_handler([&](Hdl hdl, WsServer::message_ptr msg)
    {
        // Only binary frames are valid
        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            fmt::print(stderr, "[manord] ignoring non-binary frame\n");
            return;
        }

        std::string const& payload = msg->get_payload();
        std::span<std::byte const> const bytes{reinterpret_cast<std::byte const*>(payload.data()), payload.size()};
        try
        {
            router.OnFrame(hdl, bytes);
        }
        catch (core::OmegaException<core::error::Code> const& e)
        {
            fmt::print(stderr, "[manord] frame failed: {}\n", e.to_str());
        }
    });

    server.set_close_handler([&](Hdl hdl)
    {
        router.OnClose(hdl);
    });

    websocketpp::lib::error_code ec;
    server.listen(cfg.port, ec);
    if (ec)
    {
        fmt::print(stderr, "[manord] listen on {} failed: {}\n", cfg.port, ec.message());
        return 1;
    }
    server.start_accept();

    std::thread net_thr([&server]()
    {
        server.run();
    });

    if (net_thr.joinable())
    {
        net_thr.join();
    }
    return 0;
}
