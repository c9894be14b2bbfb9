#include <algorithm>
#include <gtest/gtest.h>
#include <numeric>
#include <vector>

#include <batchflow/random_state.hpp>

using batchflow::RandomState;

TEST(RandomStateTest, SameSeedSameSequence) {
    RandomState a{42};
    RandomState b{42};
    EXPECT_EQ(a.get_seed(), 42u);
    for (int i = 0; i < 10; ++i)
        EXPECT_EQ(a.random_sample(), b.random_sample());
    EXPECT_EQ(a.random_integers(0, 100, 16), b.random_integers(0, 100, 16));
    EXPECT_EQ(a.standard_normal(8), b.standard_normal(8));
}

TEST(RandomStateTest, ResetRestartsFromStoredSeed) {
    RandomState rs{7};
    auto first = rs.random_integers(0, 1000, 8);
    auto second = rs.random_integers(0, 1000, 8);
    EXPECT_NE(first, second);
    rs.reset();
    EXPECT_EQ(rs.random_integers(0, 1000, 8), first);
}

TEST(RandomStateTest, SetSeedReplacesSequence) {
    RandomState a{1};
    RandomState b{2};
    b.set_seed(1);
    EXPECT_EQ(b.get_seed(), 1u);
    EXPECT_EQ(a.standard_normal(4), b.standard_normal(4));
}

TEST(RandomStateTest, ChildStatesAreDeterministic) {
    RandomState a{3};
    RandomState b{3};
    EXPECT_EQ(a.generate_seed(), b.generate_seed());
    auto ca = a.create_random_state();
    auto cb = b.create_random_state();
    EXPECT_EQ(ca.get_seed(), cb.get_seed());
    EXPECT_EQ(ca.random_sample(), cb.random_sample());
    EXPECT_EQ(a.create_random_state(99).get_seed(), 99u);
}

TEST(RandomStateTest, IntegerBoundsAreInclusive) {
    RandomState rs{11};
    auto draws = rs.random_integers(0, 2, 1000);
    EXPECT_EQ(*std::min_element(draws.begin(), draws.end()), 0u);
    EXPECT_EQ(*std::max_element(draws.begin(), draws.end()), 2u);
    EXPECT_EQ(rs.random_integer(5, 5), 5u);
}

TEST(RandomStateTest, SampleIsInUnitInterval) {
    RandomState rs{5};
    for (int i = 0; i < 1000; ++i) {
        double v = rs.random_sample();
        EXPECT_GE(v, 0.0);
        EXPECT_LT(v, 1.0);
    }
}

TEST(RandomStateTest, ShuffleIsAPermutation) {
    RandomState rs{9};
    std::vector<std::size_t> v(50);
    std::iota(v.begin(), v.end(), 0);
    rs.shuffle(v);
    std::vector<std::size_t> sorted = v;
    std::sort(sorted.begin(), sorted.end());
    for (std::size_t i = 0; i < sorted.size(); ++i)
        EXPECT_EQ(sorted[i], i);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
