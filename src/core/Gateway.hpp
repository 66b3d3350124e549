//
// Created by Malik T on 07/11/2025.
//

#ifndef MANORGAME_GATEWAY_HPP
#define MANORGAME_GATEWAY_HPP

#include <span>
#include "Outbound.hpp"

namespace manor::core
{
    class Session;

    class BroadcastGateway
    {
    public:
        virtual ~BroadcastGateway() = default;

        // Called on the session's actor thread with everything one command produced.
        // Must be done with every send (or have dropped the failing connection) on return.
        virtual auto Deliver(Session const& session, std::span<Broadcast const> batch) -> void = 0;
    };
}

#endif //MANORGAME_GATEWAY_HPP
