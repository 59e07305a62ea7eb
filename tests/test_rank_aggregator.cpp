#include <gtest/gtest.h>
#include "RankAggregator.hpp"

TEST(RankAggregatorTest, MinimumIsBest)
{
    std::vector<std::pair<std::string, double>> scores = {{"A", 0.9}, {"B", 0.5}, {"C", 0.7}};
    RankMap ranks = RankAggregator::rank(scores, ScoringStrategy::argMin());

    ASSERT_EQ(ranks.size(), 3u);
    EXPECT_EQ(ranks["B"].rank, 0);
    EXPECT_EQ(ranks["C"].rank, 1);
    EXPECT_EQ(ranks["A"].rank, 2);
    EXPECT_DOUBLE_EQ(ranks["B"].score, 0.5);
    EXPECT_DOUBLE_EQ(ranks["C"].score, 0.7);
    EXPECT_DOUBLE_EQ(ranks["A"].score, 0.9);
    EXPECT_EQ(RankAggregator::bestVariable(ranks), "B");
}

TEST(RankAggregatorTest, MaximumIsBest)
{
    std::vector<std::pair<std::string, double>> scores = {{"A", 0.9}, {"B", 0.5}, {"C", 0.7}};
    RankMap ranks = RankAggregator::rank(scores, ScoringStrategy::argMax());

    EXPECT_EQ(ranks["A"].rank, 0);
    EXPECT_EQ(ranks["C"].rank, 1);
    EXPECT_EQ(ranks["B"].rank, 2);
}

TEST(RankAggregatorTest, TiesFollowEncounterOrder)
{
    std::vector<std::pair<std::string, double>> scores = {{"z", 1.0}, {"y", 1.0}, {"x", 1.0}};
    RankMap ranks = RankAggregator::rank(scores, ScoringStrategy::argMin());

    EXPECT_EQ(ranks["z"].rank, 0);
    EXPECT_EQ(ranks["y"].rank, 1);
    EXPECT_EQ(ranks["x"].rank, 2);

    RankMap again = RankAggregator::rank(scores, ScoringStrategy::argMin());
    EXPECT_EQ(again["z"].rank, ranks["z"].rank);
    EXPECT_EQ(again["x"].rank, ranks["x"].rank);
}

TEST(RankAggregatorTest, ScoreMapUsesVariableNames)
{
    ScoreMap scores;
    scores[2] = 0.1;
    scores[0] = 0.3;
    std::vector<std::string> names = {"alpha", "beta", "gamma"};

    RankMap ranks = RankAggregator::rank(scores, names, ScoringStrategy::closestTo(0.25));
    EXPECT_EQ(ranks.count("beta"), 0u);
    EXPECT_EQ(ranks["alpha"].rank, 0);
    EXPECT_EQ(ranks["gamma"].rank, 1);
}

TEST(RankAggregatorTest, SingleAndEmptyInputs)
{
    std::vector<std::pair<std::string, double>> one = {{"only", 3.5}};
    RankMap ranks = RankAggregator::rank(one, ScoringStrategy::argMax());
    ASSERT_EQ(ranks.size(), 1u);
    EXPECT_EQ(ranks["only"].rank, 0);

    EXPECT_TRUE(RankAggregator::rank(std::vector<std::pair<std::string, double>>(),
                                     ScoringStrategy::argMax())
                    .empty());
    EXPECT_THROW(RankAggregator::bestVariable(RankMap()), std::runtime_error);
}

TEST(RankAggregatorTest, OutOfRangeComparatorThrows)
{
    ScoringStrategy broken = ScoringStrategy::custom(
        [](const std::vector<double> &scores)
        { return static_cast<int>(scores.size()); });
    std::vector<std::pair<std::string, double>> scores = {{"a", 1.0}, {"b", 2.0}};

    EXPECT_THROW(RankAggregator::rank(scores, broken), std::out_of_range);
}
