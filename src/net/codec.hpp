#ifndef MANORGAME_CODEC_HPP
#define MANORGAME_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <span>
#include <variant>
#include <vector>
#include <string>
#include <expected>
#include <flatbuffers/flatbuffers.h>

#include "../core/Types.hpp"
#include "../core/Actions.hpp"
#include "../core/Exception.hpp"
#include "../core/Outbound.hpp"
#include "../core/RoomCatalog.hpp"
#include "../core/Visibility.hpp"

#include "generated/flatbuffers/manor_net_generated.h"

namespace manor::core::net
{
    inline constexpr std::uint16_t SchemaVersion = 1;

    // Lightweight local parse error
    struct ParseError
    {
        std::string message;
    };

    // ----- What a client frame decodes into -----

    struct CreateSessionReq { PlayerProfile profile; bool conspiracy_mode{false}; };
    struct JoinSessionReq   { std::string code; PlayerProfile profile; };
    struct AttachReq        { std::string code; PlyrIdxT player{}; std::string token; };
    struct StartGameReq     {};
    struct ResetGameReq     {};
    struct ChangeRoleReq    { Role role{}; std::optional<PlayerClass> player_class{}; };
    struct GameActionReq    { PlayerAction action; };

    using ClientRequest = std::variant<
      CreateSessionReq, JoinSessionReq, AttachReq, StartGameReq, ResetGameReq, ChangeRoleReq, GameActionReq>;

    struct DecodedRequest
    {
        std::uint64_t msg_id{};
        ClientRequest request;
    };

    // ----- What a server frame decodes into (clients, tests) -----

    struct WelcomeMsg   { std::string code; PlyrIdxT player{}; std::string token; };
    struct ViolationMsg { error::RuleViolationCode code{}; std::string reason; };
    struct RejectedMsg  { error::LobbyErrorCode code{}; std::string reason; };

    using ServerMessage = std::variant<WelcomeMsg, SessionView, Notice, ViolationMsg, RejectedMsg>;

    struct DecodedServerMessage
    {
        std::uint64_t msg_id{};
        ServerMessage message;
    };

    auto ToFbRole(Role r) noexcept -> manor::gen::net::Role;
    auto ToFbPhase(Phase p) noexcept -> manor::gen::net::Phase;
    auto ToFbClass(PlayerClass c) noexcept -> manor::gen::net::PlayerClass;
    auto ToFbPower(PowerKind k) noexcept -> manor::gen::net::PowerKind;

    // --- Outbound builders (server → client) ---

    auto BuildWelcome(std::string_view code, PlyrIdxT player, std::string_view token, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // Names and floors are taken from the catalog so clients need no topology of their own.
    auto BuildStateUpdate(SessionView const& view, RoomCatalog const& catalog, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildNotice(Notice const& n, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    auto BuildViolation(error::RuleViolation const& v, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    auto BuildRejected(error::LobbyError const& e, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    // --- Client builders (client → server) ---

    auto BuildCreateSession(PlayerProfile const& host, bool conspiracy_mode, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;
    auto BuildJoinSession(std::string_view code, PlayerProfile const& profile, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;
    auto BuildAttach(std::string_view code, PlyrIdxT player, std::string_view token, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;
    auto BuildStartGame(std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildResetGame(std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildChangeRole(Role role, std::optional<PlayerClass> player_class, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;
    auto BuildAction(PlayerAction const& action, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    // --- Inbound decode (verified) ---

    auto DecodeClientMessage(std::span<std::byte const> bytes) -> std::expected<DecodedRequest, ParseError>;

    auto DecodeServerMessage(std::span<std::byte const> bytes) -> std::expected<DecodedServerMessage, ParseError>;
} // namespace manor::core::net


#endif //MANORGAME_CODEC_HPP
