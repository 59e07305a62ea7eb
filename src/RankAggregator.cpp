#include <stdexcept>
#include "RankAggregator.hpp"

using namespace std;

RankMap RankAggregator::rank(const std::vector<std::pair<std::string, double>> &scores,
                             const ScoringStrategy &strategy)
{
    RankMap ranks;
    std::vector<std::pair<std::string, double>> remaining = scores;

    int next_rank = 0;
    while (remaining.size() > 1)
    {
        std::vector<double> values;
        values.reserve(remaining.size());
        for (size_t i = 0; i < remaining.size(); ++i)
        {
            values.push_back(remaining[i].second);
        }

        int best = strategy.bestIndex(values);
        if (best < 0 || best >= static_cast<int>(remaining.size()))
        {
            throw std::out_of_range("Scoring strategy '" + strategy.getName() + "' returned index " +
                                    to_string(best) + " for " + to_string(remaining.size()) + " scores");
        }

        const std::pair<std::string, double> &entry = remaining[best];
        if (!ranks.insert(std::make_pair(entry.first, RankedScore(next_rank, entry.second))).second)
        {
            throw std::invalid_argument("Duplicate variable '" + entry.first + "' in score list");
        }
        remaining.erase(remaining.begin() + best);
        next_rank++;
    }

    if (remaining.size() == 1)
    {
        if (!ranks.insert(std::make_pair(remaining[0].first, RankedScore(next_rank, remaining[0].second))).second)
        {
            throw std::invalid_argument("Duplicate variable '" + remaining[0].first + "' in score list");
        }
    }

    return ranks;
}

RankMap RankAggregator::rank(const ScoreMap &scores, const std::vector<std::string> &variable_names,
                             const ScoringStrategy &strategy)
{
    std::vector<std::pair<std::string, double>> named;
    named.reserve(scores.size());

    for (ScoreMap::const_iterator it = scores.begin(); it != scores.end(); ++it)
    {
        if (it->first < 0 || it->first >= static_cast<int>(variable_names.size()))
        {
            throw std::out_of_range("Variable index " + to_string(it->first) + " has no name");
        }
        named.push_back(std::make_pair(variable_names[it->first], it->second));
    }

    return rank(named, strategy);
}

std::string RankAggregator::bestVariable(const RankMap &ranks)
{
    for (RankMap::const_iterator it = ranks.begin(); it != ranks.end(); ++it)
    {
        if (it->second.rank == 0)
        {
            return it->first;
        }
    }
    throw std::runtime_error("No variable holds rank 0");
}
