#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "card.hpp"
#include "hand.hpp"
#include "rng.hpp"

namespace bj {

    enum class StrategyKind {
        Simplest,
        Random,
        Basic,
        BasicNoSplit,
        BasicNoAceSplit,
        BasicNoSplitsOrAces
    };

    // What the round engine allows for the hand about to act.
    struct DecisionContext {
        bool can_double = false;    // first decision on a two-card, non-split hand
        bool can_split = false;     // two cards of equal value and room for another hand
        double true_count = 0.0;
        Rng* rng = nullptr;
    };

    std::vector<Action> legal_actions(const DecisionContext& ctx);

    class Strategy {
    public:
        virtual ~Strategy() = default;
        virtual StrategyKind kind() const = 0;
        virtual std::string name() const = 0;
        virtual Action decide(const Hand& hand, Card dealer_up, const DecisionContext& ctx) const = 0;
    };

    // Hits below 17 and stands on any 17 or more, soft or hard. Never doubles
    // or splits.
    class SimplestStrategy : public Strategy {
    public:
        StrategyKind kind() const override { return StrategyKind::Simplest; }
        std::string name() const override { return "simplest"; }
        Action decide(const Hand& hand, Card dealer_up, const DecisionContext& ctx) const override;
    };

    // Uniform over legal_actions(ctx), drawn from the session generator.
    class RandomStrategy : public Strategy {
    public:
        StrategyKind kind() const override { return StrategyKind::Random; }
        std::string name() const override { return "random"; }
        Action decide(const Hand& hand, Card dealer_up, const DecisionContext& ctx) const override;
    };

    struct BasicOptions {
        bool split_pairs = true;
        bool split_aces = true;
        bool use_soft_totals = true;
    };

    // Table driven: pair table, then soft totals, then hard totals, each keyed
    // by the dealer up-card. Doubles that are not allowed fall back to the
    // chart's second choice (hit, or stand on soft 18/19).
    class BasicStrategy : public Strategy {
    public:
        BasicStrategy(StrategyKind kind, BasicOptions options);
        StrategyKind kind() const override { return kind_; }
        std::string name() const override;
        Action decide(const Hand& hand, Card dealer_up, const DecisionContext& ctx) const override;

    private:
        StrategyKind kind_;
        BasicOptions options_;
    };

    struct IllegalAction {
        Action proposed;
        Action resolved;
        std::string reason;
    };

    // Downgrade policy, identical for every strategy:
    //   Double when not allowed -> Hit
    //   Split when not allowed  -> Stand on 17 or more, Hit otherwise
    // Legal proposals pass through and `defect` is left empty.
    Action resolve_action(Action proposed, const Hand& hand, const DecisionContext& ctx,
                          std::optional<IllegalAction>& defect);

    const std::vector<std::string>& strategy_names();
    bool is_known_strategy(const std::string& name);
    StrategyKind strategy_kind(const std::string& name);
    std::string strategy_name(StrategyKind kind);

    // Throws InvalidConfiguration for unknown names.
    std::unique_ptr<Strategy> make_strategy(const std::string& name);
}
