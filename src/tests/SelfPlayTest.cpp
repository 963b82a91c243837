#include <gtest/gtest.h>
#include <array>
#include <filesystem>
#include <format>
#include <fstream>
#include <random>
#include <sstream>

#include "../core/Arbiter.hpp"
#include "../core/ClassicRules.hpp"
#include "../core/Game.hpp"
#include "../debug/AuditLogger.hpp"
#include "../debug/Invariants.hpp"
#include "../debug/RecordingProposer.hpp"
#include "../proposer/FirstLegalProposer.hpp"
#include "../proposer/RandomProposer.hpp"

using namespace uno::core;

namespace
{
    auto random_card(std::mt19937& rng, std::string id) -> Card
    {
        static constexpr std::array<Color, 4> colors{Color::Red, Color::Blue, Color::Green, Color::Yellow};
        Color const c = colors[std::uniform_int_distribution<size_t>{0, 3}(rng)];
        switch (std::uniform_int_distribution<int>{0, 12}(rng))
        {
        case 10: return Card{std::move(id), c, std::nullopt, CardAction::Skip};
        case 11: return Card{std::move(id), c, std::nullopt, CardAction::Reverse};
        case 12:
        {
            // specials share the last slot
            switch (std::uniform_int_distribution<int>{0, 2}(rng))
            {
            case 0: return Card{std::move(id), c, std::nullopt, CardAction::DrawTwo};
            case 1: return Card{std::move(id), Color::Black, std::nullopt, CardAction::Wild};
            default: return Card{std::move(id), Color::Black, std::nullopt, CardAction::DrawFour};
            }
        }
        default:
            return Card{std::move(id), c, static_cast<uint8_t>(std::uniform_int_distribution<int>{0, 9}(rng)),
                        std::nullopt};
        }
    }

    auto make_game(uint64_t seed) -> GameState
    {
        std::mt19937 rng(static_cast<std::mt19937::result_type>(seed));
        std::vector<Card> hand;
        for (int i = 0; i < 9; ++i) hand.push_back(random_card(rng, std::format("card_{}", i)));
        Card top = random_card(rng, "start");
        // a fresh game never opens on a penalty
        if (IsDrawAction(top.action)) top = Card{"start", Color::Red, 0, std::nullopt};
        return GameState(std::move(hand), {top}, 1, 0, false, {OpponentInfo{"Bob", 7}, OpponentInfo{"Eve", 7}});
    }

    // Runs decisions until the hand is empty or the step cap is hit; returns the steps taken.
    auto play_out(GameState& game, Arbiter const& arbiter, MoveProposer& proposer, debug::AuditLogger& log,
                  std::string const& provider) -> int
    {
        int steps = 0;
        for (; steps < 60 && game.HandSize() > 0; ++steps)
        {
            GameState const before = game;
            log.start(before, provider);
            Decision const d = arbiter.Decide(game, proposer);
            for (size_t i{}; i < d.attempts.size(); ++i) log.attempt(i + 1, d.attempts[i]);
            log.decision(d);

            EXPECT_LE(d.attempts.size(), arbiter.Cfg().retry_budget);
            if (d.outcome == DecisionOutcome::Fallback)
            {
                EXPECT_EQ(d.attempts.size(), arbiter.Cfg().retry_budget);
                EXPECT_EQ(d.move, FallbackMove());
            }
            debug::CheckTransition(before, game, d.move);
        }
        log.flush();
        return steps;
    }
}

TEST(SelfPlay, RandomProposerTranscripts)
{
    namespace fs = std::filesystem;
    fs::create_directories("_artifacts");

    Config cfg{};
    cfg.retry_budget = 3;
    Arbiter const arbiter(cfg, std::make_unique<ClassicRules>());

    for (uint64_t seed : {111ull, 222ull, 333ull})
    {
        std::string const path = std::format("_artifacts/uno_{}.log", seed);
        GameState game = make_game(seed);
        auto rec = std::make_shared<debug::RecordingProposer>(std::make_shared<uno::proposer::RandomProposer>(seed));

        {
            debug::AuditLogger log(path);
            ASSERT_TRUE(log.IsOpen());
            try
            {
                int const steps = play_out(game, arbiter, *rec, log, "random");
                EXPECT_GT(steps, 0);
            }
            catch (OmegaException<error::Code> const& e)
            {
                FAIL() << std::format("{}", e);
            }
        }

        // every proposer call saw a snapshot no larger than the hand it started with
        for (auto const& call : rec->Calls())
            EXPECT_LE(call.snapshot->my_hand.size(), 9u);

        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        EXPECT_FALSE(ss.str().empty());
    }
}

TEST(SelfPlay, FirstLegalNeverFallsBack)
{
    Arbiter const arbiter(Config{}, std::make_unique<ClassicRules>());
    uno::proposer::FirstLegalProposer proposer;

    for (uint64_t seed = 1; seed <= 20; ++seed)
    {
        GameState game = make_game(seed);
        for (int step = 0; step < 40 && game.HandSize() > 0; ++step)
        {
            GameState const before = game;
            Decision const d = arbiter.Decide(game, proposer);
            ASSERT_EQ(d.outcome, DecisionOutcome::Accepted) << "seed " << seed << " step " << step;
            ASSERT_EQ(d.attempts.size(), 1u);
            debug::CheckTransition(before, game, d.move);
        }
    }
}
