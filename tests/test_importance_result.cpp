#include <gtest/gtest.h>
#include <sstream>
#include "ImportanceResult.hpp"

namespace
{
    RankMap roundOf(const std::vector<std::pair<std::string, double>> &scores)
    {
        return RankAggregator::rank(scores, ScoringStrategy::argMax());
    }
}

TEST(ImportanceResultTest, RecordsBaselineAndRounds)
{
    ImportanceResult result("sequential_forward_selection", {"a", "b", "c"}, 0.25);
    EXPECT_EQ(result.getMethod(), "sequential_forward_selection");
    EXPECT_DOUBLE_EQ(result.getOriginalScore(), 0.25);
    EXPECT_EQ(result.getNumRounds(), 0);

    result.addNewResults(roundOf({{"a", 0.4}, {"b", 0.6}, {"c", 0.5}}), "b");
    result.addNewResults(roundOf({{"a", 0.7}, {"c", 0.8}}), "c");

    EXPECT_EQ(result.getNumRounds(), 2);
    EXPECT_EQ(result.getImportantVariables(), (std::vector<std::string>{"b", "c"}));
    EXPECT_EQ(result.getRound(1).size(), 2u);
    EXPECT_THROW(result.getRound(2), std::out_of_range);
}

TEST(ImportanceResultTest, SinglepassAndMultipassViews)
{
    ImportanceResult result("m", {"a", "b", "c"}, 0.0);
    EXPECT_THROW(result.getSinglepass(), std::runtime_error);

    result.addNewResults(roundOf({{"a", 0.4}, {"b", 0.6}, {"c", 0.5}}), "b");
    result.addNewResults(roundOf({{"a", 0.7}, {"c", 0.8}}), "c");

    RankMap single = result.getSinglepass();
    EXPECT_EQ(single["b"].rank, 0);
    EXPECT_EQ(single["c"].rank, 1);
    EXPECT_EQ(single["a"].rank, 2);

    RankMap multi = result.getMultipass();
    ASSERT_EQ(multi.size(), 2u);
    EXPECT_EQ(multi["b"].rank, 0);
    EXPECT_DOUBLE_EQ(multi["b"].score, 0.6);
    EXPECT_EQ(multi["c"].rank, 1);
    EXPECT_DOUBLE_EQ(multi["c"].score, 0.8);
}

TEST(ImportanceResultTest, RejectsInconsistentAppends)
{
    ImportanceResult result("m", {"a", "b"}, 0.0);
    RankMap first = roundOf({{"a", 0.4}, {"b", 0.6}});

    EXPECT_THROW(result.addNewResults(first, "z"), std::invalid_argument);
    result.addNewResults(first, "b");
    EXPECT_THROW(result.addNewResults(roundOf({{"a", 0.1}, {"b", 0.2}}), "b"), std::invalid_argument);
    EXPECT_THROW(result.addNewResults(roundOf({{"b", 0.2}}), "a"), std::invalid_argument);
    EXPECT_EQ(result.getNumRounds(), 1);
}

TEST(ImportanceResultTest, CsvListsRoundsInRankOrder)
{
    ImportanceResult result("m", {"a", "b"}, 1.5);
    result.addNewResults(roundOf({{"a", 0.25}, {"b", 0.75}}), "b");

    std::ostringstream out;
    result.toCsv(out);

    EXPECT_EQ(out.str(),
              "round,variable,rank,score,selected\n"
              "baseline,,,1.5,\n"
              "0,b,0,0.75,1\n"
              "0,a,1,0.25,0\n");
}
