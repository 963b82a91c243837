//
// TextProposer.hpp
//

#ifndef UNOARBITER_TEXTPROPOSER_HPP
#define UNOARBITER_TEXTPROPOSER_HPP

#include <functional>
#include <string>

#include "../core/Proposer.hpp"

namespace uno::proposer
{
    // Adapts a source of free text (typically a language model) into a MoveProposer.
    class TextProposer final : public core::MoveProposer
    {
    public:
        // Receives the rendered context; returns raw text or a failure.
        using TextSource = std::function<core::Consultation(std::string const& context,
                                                            std::chrono::steady_clock::time_point deadline)>;

        explicit TextProposer(TextSource move_source, TextSource analysis_source = {});

        auto Propose(std::shared_ptr<core::GameSnapshot const> snapshot,
                     std::chrono::steady_clock::time_point deadline) -> core::Proposal override;

        auto Consult(std::shared_ptr<core::GameSnapshot const> snapshot,
                     std::chrono::steady_clock::time_point deadline) -> core::Consultation override;

    private:
        TextSource move_source_;
        TextSource analysis_source_;
    };
}

#endif //UNOARBITER_TEXTPROPOSER_HPP
