#include "strategy.hpp"
#include "constants.hpp"
#include "errors.hpp"

#include <algorithm>
#include <array>

namespace bj {

namespace {

// Columns: dealer up-card 2 3 4 5 6 7 8 9 10 A
// H hit, S stand, D double else hit, d double else stand, P split
using ChartRow = const char*;

const std::array<ChartRow, 22> HARD_CHART = {
    "HHHHHHHHHH", "HHHHHHHHHH", "HHHHHHHHHH", "HHHHHHHHHH",   // 0-3 unused
    "HHHHHHHHHH",   // 4
    "HHHHHHHHHH",   // 5
    "HHHHHHHHHH",   // 6
    "HHHHHHHHHH",   // 7
    "HHHHHHHHHH",   // 8
    "HDDDDHHHHH",   // 9
    "DDDDDDDDHH",   // 10
    "DDDDDDDDDD",   // 11
    "HHSSSHHHHH",   // 12
    "SSSSSHHHHH",   // 13
    "SSSSSHHHHH",   // 14
    "SSSSSHHHHH",   // 15
    "SSSSSHHHHH",   // 16
    "SSSSSSSSSS",   // 17
    "SSSSSSSSSS",   // 18
    "SSSSSSSSSS",   // 19
    "SSSSSSSSSS",   // 20
    "SSSSSSSSSS",   // 21
};

// Indexed by soft total; a soft hand is always 12..21.
const std::array<ChartRow, 22> SOFT_CHART = {
    "", "", "", "", "", "", "", "", "", "", "", "",
    "HHHHHHHHHH",   // 12 (A,A unsplit)
    "HHHDDHHHHH",   // 13
    "HHHDDHHHHH",   // 14
    "HHDDDHHHHH",   // 15
    "HHDDDHHHHH",   // 16
    "HDDDDHHHHH",   // 17
    "dddddSSHHH",   // 18
    "SSSSdSSSSS",   // 19
    "SSSSSSSSSS",   // 20
    "SSSSSSSSSS",   // 21
};

// Indexed by the value of one card of the pair (A = 11). Anything but P
// falls through to the totals charts.
const std::array<ChartRow, 12> PAIR_CHART = {
    "", "",
    "PPPPPPHHHH",   // 2,2
    "PPPPPPHHHH",   // 3,3
    "HHHPPHHHHH",   // 4,4
    "DDDDDDDDHH",   // 5,5
    "PPPPPHHHHH",   // 6,6
    "PPPPPPHHHH",   // 7,7
    "PPPPPPPPPP",   // 8,8
    "PPPPPSPPSS",   // 9,9
    "SSSSSSSSSS",   // 10,10
    "PPPPPPPPPP",   // A,A
};

int upcard_column(Card dealer_up) {
    return card_value(dealer_up) - 2;
}

Action chart_action(char code, const DecisionContext& ctx) {
    switch (code) {
        case 'S': return Action::Stand;
        case 'D': return ctx.can_double ? Action::Double : Action::Hit;
        case 'd': return ctx.can_double ? Action::Double : Action::Stand;
        case 'P': return Action::Split;
        default: return Action::Hit;
    }
}

struct RegistryEntry {
    StrategyKind kind;
    const char* name;
};

const std::array<RegistryEntry, 6> REGISTRY = {{
    {StrategyKind::Simplest, "simplest"},
    {StrategyKind::Random, "random"},
    {StrategyKind::Basic, "basic"},
    {StrategyKind::BasicNoSplit, "basic_no_split"},
    {StrategyKind::BasicNoAceSplit, "basic_no_ace_split"},
    {StrategyKind::BasicNoSplitsOrAces, "basic_no_splits_or_aces"},
}};

} // namespace

std::vector<Action> legal_actions(const DecisionContext& ctx) {
    std::vector<Action> actions = {Action::Hit, Action::Stand};
    if (ctx.can_double) actions.push_back(Action::Double);
    if (ctx.can_split) actions.push_back(Action::Split);
    return actions;
}

Action SimplestStrategy::decide(const Hand& hand, Card, const DecisionContext&) const {
    return hand.value() < DEALER_STAND_TOTAL ? Action::Hit : Action::Stand;
}

Action RandomStrategy::decide(const Hand&, Card, const DecisionContext& ctx) const {
    std::vector<Action> actions = legal_actions(ctx);
    if (ctx.rng == nullptr) {
        throw std::logic_error("RandomStrategy::decide requires the session generator");
    }
    int idx = ctx.rng->uniform_int(0, static_cast<int>(actions.size()) - 1);
    return actions[idx];
}

BasicStrategy::BasicStrategy(StrategyKind kind, BasicOptions options)
    : kind_(kind), options_(options) {}

std::string BasicStrategy::name() const {
    return strategy_name(kind_);
}

Action BasicStrategy::decide(const Hand& hand, Card dealer_up, const DecisionContext& ctx) const {
    int col = upcard_column(dealer_up);

    if (options_.split_pairs && ctx.can_split && hand.is_pair()) {
        int pair_value = card_value(hand.cards()[0]);
        bool aces = pair_value == 11;
        if (!aces || options_.split_aces) {
            if (PAIR_CHART[pair_value][col] == 'P') return Action::Split;
        }
    }

    int total = hand.value();
    if (options_.use_soft_totals && hand.is_soft()) {
        return chart_action(SOFT_CHART[total][col], ctx);
    }
    total = std::max(4, std::min(total, BLACKJACK));
    return chart_action(HARD_CHART[total][col], ctx);
}

Action resolve_action(Action proposed, const Hand& hand, const DecisionContext& ctx,
                      std::optional<IllegalAction>& defect) {
    defect.reset();
    if (proposed == Action::Double && !ctx.can_double) {
        defect = IllegalAction{proposed, Action::Hit,
                               "double is only allowed as the first decision of a two-card, non-split hand"};
        return Action::Hit;
    }
    if (proposed == Action::Split && !ctx.can_split) {
        Action fallback = hand.value() >= DEALER_STAND_TOTAL ? Action::Stand : Action::Hit;
        defect = IllegalAction{proposed, fallback,
                               hand.is_pair() ? "split hand limit reached" : "split requires a two-card pair"};
        return fallback;
    }
    return proposed;
}

const std::vector<std::string>& strategy_names() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> out;
        for (const auto& entry : REGISTRY) out.push_back(entry.name);
        return out;
    }();
    return names;
}

bool is_known_strategy(const std::string& name) {
    return std::any_of(REGISTRY.begin(), REGISTRY.end(),
                       [&](const RegistryEntry& e) { return name == e.name; });
}

StrategyKind strategy_kind(const std::string& name) {
    for (const auto& entry : REGISTRY) {
        if (name == entry.name) return entry.kind;
    }
    throw InvalidConfiguration("unknown strategy '" + name + "'");
}

std::string strategy_name(StrategyKind kind) {
    for (const auto& entry : REGISTRY) {
        if (entry.kind == kind) return entry.name;
    }
    return "unknown";
}

std::unique_ptr<Strategy> make_strategy(const std::string& name) {
    switch (strategy_kind(name)) {
        case StrategyKind::Simplest:
            return std::make_unique<SimplestStrategy>();
        case StrategyKind::Random:
            return std::make_unique<RandomStrategy>();
        case StrategyKind::Basic:
            return std::make_unique<BasicStrategy>(StrategyKind::Basic, BasicOptions{true, true, true});
        case StrategyKind::BasicNoSplit:
            return std::make_unique<BasicStrategy>(StrategyKind::BasicNoSplit, BasicOptions{false, false, true});
        case StrategyKind::BasicNoAceSplit:
            return std::make_unique<BasicStrategy>(StrategyKind::BasicNoAceSplit, BasicOptions{true, false, true});
        case StrategyKind::BasicNoSplitsOrAces:
            return std::make_unique<BasicStrategy>(StrategyKind::BasicNoSplitsOrAces, BasicOptions{false, false, false});
    }
    throw InvalidConfiguration("unknown strategy '" + name + "'");
}

} // namespace bj
