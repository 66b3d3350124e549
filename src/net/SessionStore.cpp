//
// Created by Malik T on 09/11/2025.
//
#include "SessionStore.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>

#include "core/Session.hpp"

namespace manor::net
{
    namespace
    {
        constexpr std::string_view CodeAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
        constexpr std::string_view TokenAlphabet = "abcdefghijklmnopqrstuvwxyz0123456789";
        constexpr std::size_t TokenLength = 24;
    }

    auto NormalizeCode(std::string_view const code) -> std::string
    {
        std::string out(code);
        std::ranges::transform(out, out.begin(), [](unsigned char const c)
        {
            return static_cast<char>(std::toupper(c));
        });
        return out;
    }

    SessionStore::SessionStore(core::Config base, std::shared_ptr<core::BroadcastGateway> gateway) :
        base_(std::move(base)),
        gateway_(std::move(gateway)),
        rng_(base_.seed)
    {
    }

    SessionStore::~SessionStore()
    {
        std::map<std::string, Entry> sessions;
        {
            std::lock_guard<std::mutex> lock(m_);
            sessions.swap(sessions_);
        }
        for (auto& [code, entry] : sessions) entry.actor->Stop();
    }

    auto SessionStore::Create(core::PlayerProfile host, bool const conspiracy_mode)
        -> core::error::LobbyResult<Membership>
    {
        using core::error::LobbyErrorCode;
        if (host.name.empty()) return std::unexpected(core::error::lobby_error(LobbyErrorCode::EmptyName));

        std::lock_guard<std::mutex> lock(m_);
        std::string code = NewCode();

        core::Config cfg = base_;
        cfg.seed = rng_();
        cfg.conspiracy_mode = conspiracy_mode;

        auto session = std::make_unique<core::Session>(code, cfg, std::move(host));
        auto actor = std::make_shared<core::SessionActor>(std::move(session), gateway_);

        Entry entry{actor, {NewToken()}};
        std::string token = entry.tokens.front();
        sessions_.emplace(code, std::move(entry));

        fmt::print("[manord] session {} created ({} live)\n", code, sessions_.size());
        return Membership{std::move(code), 0, std::move(token), std::move(actor)};
    }

    auto SessionStore::Join(std::string_view const code, core::PlayerProfile profile)
        -> core::error::LobbyResult<Membership>
    {
        using core::error::LobbyErrorCode;
        std::string const key = NormalizeCode(code);

        std::shared_ptr<core::SessionActor> actor = Find(key);
        if (!actor) return std::unexpected(core::error::lobby_error(LobbyErrorCode::SessionNotFound));

        std::future<core::error::LobbyResult<core::PlyrIdxT>> fut =
            actor->Ask([profile = std::move(profile)](core::Session& s) mutable
            {
                return s.Join(std::move(profile));
            });

        core::error::LobbyResult<core::PlyrIdxT> joined = [&]() -> core::error::LobbyResult<core::PlyrIdxT>
        {
            try
            {
                return fut.get();
            }
            catch (std::future_error const& e)
            {
                // the actor stopped before running the join
                fmt::print(stderr, "[manord] join on {} dropped: {}\n", key, e.what());
                return std::unexpected(core::error::lobby_error(LobbyErrorCode::SessionNotFound));
            }
        }();
        if (!joined) return std::unexpected(joined.error());

        std::lock_guard<std::mutex> lock(m_);
        auto it = sessions_.find(key);
        if (it == sessions_.end())
            return std::unexpected(core::error::lobby_error(LobbyErrorCode::SessionNotFound));

        std::vector<std::string>& tokens = it->second.tokens;
        if (tokens.size() <= *joined) tokens.resize(*joined + 1u);
        tokens[*joined] = NewToken();

        return Membership{key, *joined, tokens[*joined], it->second.actor};
    }

    auto SessionStore::Find(std::string_view const code) const -> std::shared_ptr<core::SessionActor>
    {
        std::string const key = NormalizeCode(code);
        std::lock_guard<std::mutex> lock(m_);
        auto it = sessions_.find(key);
        return it == sessions_.end() ? nullptr : it->second.actor;
    }

    auto SessionStore::Authenticate(std::string_view const code, core::PlyrIdxT const player,
                                    std::string_view const token) const -> std::shared_ptr<core::SessionActor>
    {
        std::string const key = NormalizeCode(code);
        std::lock_guard<std::mutex> lock(m_);
        auto it = sessions_.find(key);
        if (it == sessions_.end()) return nullptr;

        std::vector<std::string> const& tokens = it->second.tokens;
        if (player >= tokens.size() || tokens[player].empty() || tokens[player] != token) return nullptr;
        return it->second.actor;
    }

    auto SessionStore::Remove(std::string_view const code) -> bool
    {
        std::shared_ptr<core::SessionActor> actor;
        {
            std::lock_guard<std::mutex> lock(m_);
            auto it = sessions_.find(NormalizeCode(code));
            if (it == sessions_.end()) return false;
            actor = std::move(it->second.actor);
            sessions_.erase(it);
        }
        actor->Stop();
        fmt::print("[manord] session {} removed\n", actor->Code());
        return true;
    }

    auto SessionStore::Size() const -> std::size_t
    {
        std::lock_guard<std::mutex> lock(m_);
        return sessions_.size();
    }

    // Caller holds m_.
    auto SessionStore::NewCode() -> std::string
    {
        std::uniform_int_distribution<std::size_t> pick(0, CodeAlphabet.size() - 1);
        for (;;)
        {
            std::string code(core::constants::SessionCodeLength, 'A');
            for (char& c : code) c = CodeAlphabet[pick(rng_)];
            if (!sessions_.contains(code)) return code;
        }
    }

    // Caller holds m_.
    auto SessionStore::NewToken() -> std::string
    {
        std::uniform_int_distribution<std::size_t> pick(0, TokenAlphabet.size() - 1);
        std::string token(TokenLength, 'a');
        for (char& c : token) c = TokenAlphabet[pick(rng_)];
        return token;
    }
}
