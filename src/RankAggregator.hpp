#ifndef RANK_AGGREGATOR_HPP
#define RANK_AGGREGATOR_HPP

#include <map>
#include <string>
#include <utility>
#include <vector>
#include "ScoringEngine.hpp"
#include "ScoringStrategy.hpp"

struct RankedScore
{
    int rank;
    double score;

    RankedScore() : rank(-1), score(0.0) {}
    RankedScore(int r, double s) : rank(r), score(s) {}
};

// variable name -> (rank, score); rank 0 is best
typedef std::map<std::string, RankedScore> RankMap;

class RankAggregator
{
public:
    // Selection sort driven by the strategy: the best remaining entry takes
    // the next rank. Ties go to the entry listed first.
    static RankMap rank(const std::vector<std::pair<std::string, double>> &scores,
                        const ScoringStrategy &strategy);

    // Entries are taken in variable-index order and named via variable_names
    static RankMap rank(const ScoreMap &scores, const std::vector<std::string> &variable_names,
                        const ScoringStrategy &strategy);

    // Name holding rank 0
    static std::string bestVariable(const RankMap &ranks);
};

#endif // RANK_AGGREGATOR_HPP
