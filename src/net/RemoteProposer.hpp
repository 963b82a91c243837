//
// RemoteProposer.hpp: server-side MoveProposer backed by a bridge connection
//

#ifndef UNOARBITER_REMOTEPROPOSER_HPP
#define UNOARBITER_REMOTEPROPOSER_HPP

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>
#include <chrono>
#include <span>
#include <utility>

#include "../core/Proposer.hpp"
#include "../core/State.hpp"
#include "codec.hpp"

namespace uno::net
{
    // One bridge connection. The transport pushes inbound frames with Enqueue
    // and supplies SendFn for outbound ones; nothing here knows about sockets.
    struct BridgeChannel
    {
        using SendFn = std::function<bool(std::span<std::uint8_t const>)>;

        explicit BridgeChannel(SendFn send_fn) : send{std::move(send_fn)} {}

        SendFn                           send;

        std::mutex                       mtx;
        std::condition_variable          cv;
        std::deque<std::vector<uint8_t>> inbox;
        bool                             connected{true};

        void Enqueue(std::vector<uint8_t> bytes)
        {
            {
                std::lock_guard<std::mutex> lock(mtx);
                inbox.emplace_back(std::move(bytes));
            }
            cv.notify_all();
        }

        void Close()
        {
            {
                std::lock_guard<std::mutex> lock(mtx);
                connected = false;
            }
            cv.notify_all();
        }

        bool IsOpen()
        {
            std::lock_guard<std::mutex> lock(mtx);
            return connected;
        }

        // false on deadline or once the channel is closed and drained
        bool WaitPopUntil(std::vector<uint8_t>& out,
                          std::chrono::steady_clock::time_point deadline)
        {
            std::unique_lock<std::mutex> lk(mtx);
            cv.wait_until(lk, deadline, [&]{ return !inbox.empty() || !connected; });
            if (inbox.empty())
            {
                return false;
            }
            out = std::move(inbox.front());
            inbox.pop_front();
            return true;
        }

        bool Send(std::span<std::uint8_t const> bytes)
        {
            if (!IsOpen() || !send)
            {
                return false;
            }
            return send(bytes);
        }
    };

    class RemoteProposer final : public core::MoveProposer
    {
    public:
        explicit RemoteProposer(std::shared_ptr<BridgeChannel> chan);

        auto Propose(std::shared_ptr<core::GameSnapshot const> snapshot,
                     std::chrono::steady_clock::time_point deadline) -> core::Proposal override;

        auto Consult(std::shared_ptr<core::GameSnapshot const> snapshot,
                     std::chrono::steady_clock::time_point deadline) -> core::Consultation override;

    private:
        // Sends one request and waits for the reply carrying the same msg_id.
        auto RoundTrip(core::GameSnapshot const& s,
                       RequestKind kind,
                       std::chrono::steady_clock::time_point deadline) -> std::expected<ReplyBody, core::ProposerFailure>;

    private:
        std::shared_ptr<BridgeChannel> chan_;
        // one outstanding request per bridge
        std::mutex call_mtx_;
        std::uint64_t next_msg_id_{0};
    };
}

#endif // UNOARBITER_REMOTEPROPOSER_HPP
