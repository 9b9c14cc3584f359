#pragma once
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

namespace bj {

    // One row per player hand; a split round produces several rows.
    struct HandRecord {
        std::string match_id;
        int round_id = 0;
        int hand_number = 0;
        std::string strategy;
        std::string bet_mode;

        std::string dealer_up_card;
        std::vector<std::string> dealer_cards;
        std::vector<std::string> player_cards;
        std::vector<std::string> actions;

        double wager = 0.0;
        bool doubled = false;
        bool split = false;
        std::string outcome;        // win | lose | push | blackjack | bust
        std::string result;         // win | lose | push
        double profit = 0.0;
        bool blackjack = false;
        bool busted = false;
        int player_total = 0;
        int dealer_total = 0;

        double true_count_prev_round = 0.0;
        int running_count = 0;
        double true_count = 0.0;
        int cards_remaining = 0;
        double decks_remaining = 0.0;

        bool operator==(const HandRecord& o) const {
            return to_string() == o.to_string();
        }
        bool operator!=(const HandRecord& o) const { return !(*this == o); }

        std::string to_string() const {
            auto join = [](const std::vector<std::string>& v) {
                std::string s;
                for (size_t i = 0; i < v.size(); ++i) {
                    if (i) s += ',';
                    s += v[i];
                }
                return s;
            };
            std::ostringstream ss;
            ss.precision(17);
            ss << match_id << '|' << round_id << '|' << hand_number << '|' << strategy << '|' << bet_mode
               << "|up=" << dealer_up_card << "|dealer=" << join(dealer_cards) << "|player=" << join(player_cards)
               << "|actions=" << join(actions) << "|wager=" << wager << "|doubled=" << doubled
               << "|split=" << split << '|' << outcome << '|' << result << "|profit=" << profit
               << "|bj=" << blackjack << "|bust=" << busted << "|totals=" << player_total << '/' << dealer_total
               << "|tc_prev=" << true_count_prev_round << "|rc=" << running_count << "|tc=" << true_count
               << "|cards=" << cards_remaining << "|decks=" << decks_remaining;
            return ss.str();
        }
    };

    struct SessionSummary {
        int rounds = 0;
        int hands = 0;
        int wins = 0;
        int losses = 0;
        int pushes = 0;
        int blackjacks = 0;
        int busts = 0;
        int doubles = 0;
        int splits = 0;
        int reshuffles = 0;
        int illegal_actions = 0;
        double total_wagered = 0.0;
        double net_profit = 0.0;
    };
}
