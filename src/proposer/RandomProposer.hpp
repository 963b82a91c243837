//
// RandomProposer.hpp
//

#ifndef UNOARBITER_RANDOMPROPOSER_HPP
#define UNOARBITER_RANDOMPROPOSER_HPP

#include <mutex>
#include <random>

#include "../core/Proposer.hpp"
#include "../core/State.hpp"
#include "../core/Types.hpp"

namespace uno::proposer
{
    // Uniform over drawing and every card in hand, legal or not. Stands in for an unreliable model.
    class RandomProposer final : public core::MoveProposer
    {
    public:
        explicit RandomProposer(uint64_t rng_seed);

        auto Propose(std::shared_ptr<core::GameSnapshot const> snapshot,
                     std::chrono::steady_clock::time_point deadline) -> core::Proposal override;

        auto Consult(std::shared_ptr<core::GameSnapshot const> snapshot,
                     std::chrono::steady_clock::time_point deadline) -> core::Consultation override;

    private:
        auto pick(size_t n) -> size_t
        {
            return std::uniform_int_distribution<size_t>{0, n - 1}(rng_);
        }

    private:
        std::mutex mtx_;
        std::mt19937 rng_;
    };
}

#endif //UNOARBITER_RANDOMPROPOSER_HPP
