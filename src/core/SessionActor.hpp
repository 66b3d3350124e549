//
// Created by Malik T on 07/11/2025.
//

#ifndef MANORGAME_SESSIONACTOR_HPP
#define MANORGAME_SESSIONACTOR_HPP

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include "Gateway.hpp"
#include "Session.hpp"

namespace manor::core
{
    // Single writer for one session. Commands run one at a time on the actor's own
    // thread; whatever a command queued for delivery is handed to the gateway before
    // the next command starts.
    class SessionActor
    {
    public:
        using Command = std::function<void(Session&)>;

        SessionActor(std::unique_ptr<Session> session, std::shared_ptr<BroadcastGateway> gateway);
        ~SessionActor();

        SessionActor(SessionActor const&) = delete;
        auto operator=(SessionActor const&) -> SessionActor& = delete;

        // Fire and forget. Returns false once the actor is stopping.
        auto Post(Command cmd) -> bool;

        // Runs `fn(Session&)` in the mailbox and hands back its result.
        template <typename Fn>
        auto Ask(Fn fn) -> std::future<std::invoke_result_t<Fn&, Session&>>
        {
            using R = std::invoke_result_t<Fn&, Session&>;
            auto task = std::make_shared<std::packaged_task<R(Session&)>>(std::move(fn));
            std::future<R> fut = task->get_future();
            if (!Post([task](Session& s) { (*task)(s); }))
            {
                // dropping the task breaks the promise; the caller sees broken_promise
                task.reset();
            }
            return fut;
        }

        // Drains what is queued, then joins the worker.
        auto Stop() -> void;

        auto Code() const noexcept -> std::string const& { return code_; }

    private:
        auto Run() -> void;
        auto Deliver() -> void;

    private:
        std::string code_;
        std::unique_ptr<Session> session_;
        std::shared_ptr<BroadcastGateway> gateway_;

        std::mutex m_;
        std::condition_variable cv_;
        std::deque<Command> q_;
        bool stopping_{false};

        std::thread worker_;
    };
}

#endif //MANORGAME_SESSIONACTOR_HPP
