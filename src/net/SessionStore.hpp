//
// Created by Malik T on 09/11/2025.
//

#ifndef MANORGAME_SESSIONSTORE_HPP
#define MANORGAME_SESSIONSTORE_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include "core/Exception.hpp"
#include "core/Gateway.hpp"
#include "core/SessionActor.hpp"
#include "core/Types.hpp"

namespace manor::net
{
    // What a client needs to talk to its session again.
    struct Membership
    {
        std::string code;
        core::PlyrIdxT player{};
        std::string token;
        std::shared_ptr<core::SessionActor> actor;
    };

    // Registry of live sessions, owned by the server. Each session runs on its own actor;
    // the store only hands actors out and never touches session state itself.
    class SessionStore
    {
    public:
        SessionStore(core::Config base, std::shared_ptr<core::BroadcastGateway> gateway);
        ~SessionStore();

        SessionStore(SessionStore const&) = delete;
        auto operator=(SessionStore const&) -> SessionStore& = delete;

        // New session with `host` as player 0.
        auto Create(core::PlayerProfile host, bool conspiracy_mode) -> core::error::LobbyResult<Membership>;

        // Blocks until the session's actor has processed the join.
        auto Join(std::string_view code, core::PlayerProfile profile) -> core::error::LobbyResult<Membership>;

        // Lookups are case-insensitive. Null when unknown.
        auto Find(std::string_view code) const -> std::shared_ptr<core::SessionActor>;
        auto Authenticate(std::string_view code, core::PlyrIdxT player, std::string_view token) const
            -> std::shared_ptr<core::SessionActor>;

        // Stops the session's actor once its queue is drained.
        auto Remove(std::string_view code) -> bool;

        auto Size() const -> std::size_t;

    private:
        struct Entry
        {
            std::shared_ptr<core::SessionActor> actor;
            std::vector<std::string> tokens; // by player index
        };

        auto NewCode() -> std::string;
        auto NewToken() -> std::string;

    private:
        core::Config base_;
        std::shared_ptr<core::BroadcastGateway> gateway_;

        mutable std::mutex m_;
        std::mt19937_64 rng_;
        std::map<std::string, Entry> sessions_;
    };

    // Upper-cases a user supplied session code.
    auto NormalizeCode(std::string_view code) -> std::string;
}

#endif //MANORGAME_SESSIONSTORE_HPP
