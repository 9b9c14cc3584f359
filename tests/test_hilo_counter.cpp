#include <gtest/gtest.h>

#include "hilo_counter.hpp"
#include "rng.hpp"
#include "shoe.hpp"
#include "test_helpers.hpp"

using namespace bj;
using bj::test_support::C;

TEST(HiLo, RankValues) {
    for (const char* r : {"2", "3", "4", "5", "6"}) EXPECT_EQ(hi_lo_value(C(r)), 1) << r;
    for (const char* r : {"7", "8", "9"}) EXPECT_EQ(hi_lo_value(C(r)), 0) << r;
    for (const char* r : {"10", "J", "Q", "K", "A"}) EXPECT_EQ(hi_lo_value(C(r)), -1) << r;
}

TEST(HiLo, FullShoeSumsToZero) {
    for (int d = MIN_DECKS; d <= MAX_DECKS; ++d) {
        Rng rng(100 + d);
        HiLoCounter counter;
        Shoe shoe(d, rng, counter);
        while (shoe.remaining() > 0) shoe.draw();
        EXPECT_EQ(counter.running_count(), 0) << d << " decks";
        EXPECT_EQ(counter.observed(), 52 * d);
    }
}

TEST(HiLo, TrueCountDividesByWholeDecksWithFloorOfOne) {
    HiLoCounter counter;
    for (int i = 0; i < 6; ++i) counter.observe(C("5"));
    EXPECT_DOUBLE_EQ(counter.true_count(3.9), 2.0);
    EXPECT_DOUBLE_EQ(counter.true_count(2.0), 3.0);
    EXPECT_DOUBLE_EQ(counter.true_count(0.4), 6.0);
    EXPECT_DOUBLE_EQ(counter.true_count(0.0), 6.0);
}

TEST(HiLo, ResetZeroesRunningCount) {
    HiLoCounter counter;
    counter.observe(C("K"));
    counter.observe(C("A"));
    EXPECT_EQ(counter.running_count(), -2);
    counter.reset();
    EXPECT_EQ(counter.running_count(), 0);
}
