//
// RecordingProposer.hpp
//

#ifndef UNOARBITER_RECORDINGPROPOSER_HPP
#define UNOARBITER_RECORDINGPROPOSER_HPP

#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "../core/Proposer.hpp"

namespace uno::core::debug
{
    // Wraps a proposer and keeps every snapshot it was shown and every answer it gave.
    class RecordingProposer final : public MoveProposer
    {
    public:
        struct Call
        {
            std::shared_ptr<GameSnapshot const> snapshot;
            Proposal proposal;
        };

        explicit RecordingProposer(std::shared_ptr<MoveProposer> inner)
            : inner_{std::move(inner)}
        {
        }

        auto Propose(std::shared_ptr<GameSnapshot const> s,
                     std::chrono::steady_clock::time_point deadline) -> Proposal override
        {
            Proposal p = inner_->Propose(s, deadline);
            std::lock_guard<std::mutex> lock(mtx_);
            calls_.push_back(Call{std::move(s), p});
            return p;
        }

        auto Consult(std::shared_ptr<GameSnapshot const> s,
                     std::chrono::steady_clock::time_point deadline) -> Consultation override
        {
            return inner_->Consult(std::move(s), deadline);
        }

        auto Calls() const -> std::vector<Call>
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return calls_;
        }

        auto CallCount() const -> size_t
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return calls_.size();
        }

    private:
        std::shared_ptr<MoveProposer> inner_;
        mutable std::mutex mtx_;
        std::vector<Call> calls_;
    };
} // namespace uno::core::debug

#endif //UNOARBITER_RECORDINGPROPOSER_HPP
