//
// Created by Malik T on 07/11/2025.
//
#include "SessionActor.hpp"

#include <exception>
#include <fmt/format.h>
#include "Exception.hpp"

namespace manor::core
{
    SessionActor::SessionActor(std::unique_ptr<Session> session, std::shared_ptr<BroadcastGateway> gateway) :
        session_(std::move(session)),
        gateway_(std::move(gateway))
    {
        MNR_ASSERT(session_ != nullptr, "SessionActor needs a session");
        code_ = session_->Code();
        worker_ = std::thread([this] { Run(); });
    }

    SessionActor::~SessionActor()
    {
        Stop();
    }

    auto SessionActor::Post(Command cmd) -> bool
    {
        {
            std::lock_guard<std::mutex> lock(m_);
            if (stopping_) return false;
            q_.push_back(std::move(cmd));
        }
        cv_.notify_one();
        return true;
    }

    auto SessionActor::Stop() -> void
    {
        {
            std::lock_guard<std::mutex> lock(m_);
            stopping_ = true;
        }
        cv_.notify_one();
        if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id())
            worker_.join();
    }

    auto SessionActor::Run() -> void
    {
        for (;;)
        {
            Command cmd;
            {
                std::unique_lock<std::mutex> lock(m_);
                cv_.wait(lock, [this] { return stopping_ || !q_.empty(); });
                if (q_.empty()) return; // stopping and drained
                cmd = std::move(q_.front());
                q_.pop_front();
            }

            try
            {
                cmd(*session_);
            }
            catch (OmegaException<error::Code> const& e)
            {
                // engine misuse in one command: log it and keep serving the session
                fmt::print(stderr, "[manord] session {} command failed: {}\n", code_, e.to_str());
            }
            catch (std::exception const& e)
            {
                fmt::print(stderr, "[manord] session {} command failed: {}\n", code_, e.what());
            }
            Deliver();
        }
    }

    auto SessionActor::Deliver() -> void
    {
        std::vector<Broadcast> const batch = session_->DrainOutbox();
        if (batch.empty() || !gateway_) return;
        try
        {
            gateway_->Deliver(*session_, batch);
        }
        catch (OmegaException<error::Code> const& e)
        {
            fmt::print(stderr, "[manord] session {} delivery failed: {}\n", code_, e.to_str());
        }
        catch (std::exception const& e)
        {
            fmt::print(stderr, "[manord] session {} delivery failed: {}\n", code_, e.what());
        }
    }
}
