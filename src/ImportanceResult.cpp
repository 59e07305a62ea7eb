#include <algorithm>
#include <iomanip>
#include <limits>
#include <stdexcept>
#include "ImportanceResult.hpp"

using namespace std;

// Default constructor
ImportanceResult::ImportanceResult() : original_score(0.0)
{
}

ImportanceResult::ImportanceResult(const std::string &method_name, const std::vector<std::string> &names,
                                   double baseline_score)
    : method(method_name), variable_names(names), original_score(baseline_score)
{
}

void ImportanceResult::addNewResults(const RankMap &round_ranks, const std::string &next_important_variable)
{
    if (std::find(variable_names.begin(), variable_names.end(), next_important_variable) == variable_names.end())
    {
        throw std::invalid_argument("Unknown variable: " + next_important_variable);
    }
    if (std::find(important_variables.begin(), important_variables.end(), next_important_variable) !=
        important_variables.end())
    {
        throw std::invalid_argument("Variable already selected: " + next_important_variable);
    }
    if (round_ranks.find(next_important_variable) == round_ranks.end())
    {
        throw std::invalid_argument("Selected variable " + next_important_variable + " was not ranked this round");
    }

    rounds.push_back(round_ranks);
    important_variables.push_back(next_important_variable);
}

// Getters
std::string ImportanceResult::getMethod() const
{
    return method;
}

std::vector<std::string> ImportanceResult::getVariableNames() const
{
    return variable_names;
}

double ImportanceResult::getOriginalScore() const
{
    return original_score;
}

int ImportanceResult::getNumRounds() const
{
    return static_cast<int>(rounds.size());
}

const RankMap &ImportanceResult::getRound(int round) const
{
    if (round < 0 || round >= static_cast<int>(rounds.size()))
    {
        throw std::out_of_range("Round " + to_string(round) + " does not exist");
    }
    return rounds[round];
}

std::vector<std::string> ImportanceResult::getImportantVariables() const
{
    return important_variables;
}

RankMap ImportanceResult::getSinglepass() const
{
    if (rounds.empty())
    {
        throw std::runtime_error("No rounds have been recorded yet");
    }
    return rounds[0];
}

RankMap ImportanceResult::getMultipass() const
{
    RankMap multipass;
    for (size_t i = 0; i < important_variables.size(); ++i)
    {
        const RankedScore &winner = rounds[i].find(important_variables[i])->second;
        multipass[important_variables[i]] = RankedScore(static_cast<int>(i), winner.score);
    }
    return multipass;
}

void ImportanceResult::toCsv(std::ostream &out) const
{
    std::ios::fmtflags flags = out.flags();
    std::streamsize precision = out.precision();

    out << "round,variable,rank,score,selected\n";
    out << std::setprecision(std::numeric_limits<double>::max_digits10);
    out << "baseline,,," << original_score << ",\n";

    for (size_t i = 0; i < rounds.size(); ++i)
    {
        // Rows in rank order
        std::vector<std::pair<int, std::string>> order;
        for (RankMap::const_iterator it = rounds[i].begin(); it != rounds[i].end(); ++it)
        {
            order.push_back(std::make_pair(it->second.rank, it->first));
        }
        std::sort(order.begin(), order.end());

        for (size_t j = 0; j < order.size(); ++j)
        {
            const RankedScore &entry = rounds[i].find(order[j].second)->second;
            out << i << "," << order[j].second << "," << entry.rank << "," << entry.score << ","
                << (order[j].second == important_variables[i] ? 1 : 0) << "\n";
        }
    }

    out.flags(flags);
    out.precision(precision);
}
