#ifndef IMPORTANCE_RESULT_HPP
#define IMPORTANCE_RESULT_HPP

#include <ostream>
#include <string>
#include <vector>
#include "RankAggregator.hpp"

// Append-only record of a selection run: the baseline score plus one rank map
// and one selected variable per completed round.
class ImportanceResult
{
private:
    std::string method;
    std::vector<std::string> variable_names;
    double original_score;
    std::vector<RankMap> rounds;
    std::vector<std::string> important_variables;

public:
    ImportanceResult();
    ImportanceResult(const std::string &method_name, const std::vector<std::string> &names,
                     double baseline_score);

    // Throws std::invalid_argument if the variable is unknown, already
    // selected, or missing from `round_ranks`
    void addNewResults(const RankMap &round_ranks, const std::string &next_important_variable);

    std::string getMethod() const;
    std::vector<std::string> getVariableNames() const;
    double getOriginalScore() const;
    int getNumRounds() const;
    const RankMap &getRound(int round) const;
    std::vector<std::string> getImportantVariables() const;

    // Ranks from the first round, where every candidate was scored alone
    RankMap getSinglepass() const;

    // variable -> (round in which it was selected, winning score of that round)
    RankMap getMultipass() const;

    // One line per (round, variable): round,variable,rank,score,selected
    void toCsv(std::ostream &out) const;
};

#endif // IMPORTANCE_RESULT_HPP
