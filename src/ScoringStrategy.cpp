#include <cmath>
#include <stdexcept>
#include "ScoringStrategy.hpp"
#include "SelectionExceptions.hpp"

using namespace std;

namespace
{
    // First index with the smallest (or largest) key; NaN only wins if every key is NaN
    template <typename Key>
    int firstBest(const std::vector<double> &scores, Key key, bool maximize)
    {
        int best = 0;
        double best_key = key(scores[0]);

        for (size_t i = 1; i < scores.size(); ++i)
        {
            double current = key(scores[i]);
            if (std::isnan(current))
            {
                continue;
            }
            if (std::isnan(best_key) || (maximize ? current > best_key : current < best_key))
            {
                best = static_cast<int>(i);
                best_key = current;
            }
        }

        return best;
    }

    struct Identity
    {
        double operator()(double x) const { return x; }
    };

    struct Deviation
    {
        double reference;
        explicit Deviation(double ref) : reference(ref) {}
        double operator()(double x) const { return std::fabs(x - reference); }
    };
}

ScoringStrategy::ScoringStrategy(Kind strategy_kind, double reference_value, bool bound,
                                 const Comparator &custom_comparator, const std::string &strategy_name)
    : kind(strategy_kind), reference(reference_value), reference_bound(bound),
      comparator(custom_comparator), name(strategy_name)
{
}

ScoringStrategy ScoringStrategy::fromName(const std::string &strategy_name)
{
    if (strategy_name == "min" || strategy_name == "argmin")
    {
        return argMin();
    }
    else if (strategy_name == "max" || strategy_name == "argmax")
    {
        return argMax();
    }
    else if (strategy_name == "argmin_of_abs")
    {
        return closestTo(0.0);
    }
    else if (strategy_name == "argmax_of_abs")
    {
        return farthestFrom(0.0);
    }
    else if (strategy_name == "closest_to_baseline")
    {
        return closestToBaseline();
    }
    else if (strategy_name == "farthest_from_baseline")
    {
        return farthestFromBaseline();
    }
    else
    {
        throw InvalidStrategyException("'" + strategy_name +
                                       "'. Use 'min', 'argmin', 'max', 'argmax', 'argmin_of_abs', 'argmax_of_abs', "
                                       "'closest_to_baseline' or 'farthest_from_baseline'");
    }
}

ScoringStrategy ScoringStrategy::argMin()
{
    return ScoringStrategy(ArgMin, 0.0, true, Comparator(), "argmin");
}

ScoringStrategy ScoringStrategy::argMax()
{
    return ScoringStrategy(ArgMax, 0.0, true, Comparator(), "argmax");
}

ScoringStrategy ScoringStrategy::closestTo(double reference_value)
{
    return ScoringStrategy(ClosestTo, reference_value, true, Comparator(), "closest_to");
}

ScoringStrategy ScoringStrategy::farthestFrom(double reference_value)
{
    return ScoringStrategy(FarthestFrom, reference_value, true, Comparator(), "farthest_from");
}

ScoringStrategy ScoringStrategy::closestToBaseline()
{
    return ScoringStrategy(ClosestToBaseline, 0.0, false, Comparator(), "closest_to_baseline");
}

ScoringStrategy ScoringStrategy::farthestFromBaseline()
{
    return ScoringStrategy(FarthestFromBaseline, 0.0, false, Comparator(), "farthest_from_baseline");
}

ScoringStrategy ScoringStrategy::custom(const Comparator &custom_comparator, const std::string &strategy_name)
{
    if (!custom_comparator)
    {
        throw InvalidStrategyException("custom comparator is empty");
    }
    return ScoringStrategy(Custom, 0.0, true, custom_comparator, strategy_name);
}

ScoringStrategy ScoringStrategy::withBaseline(double baseline_score) const
{
    if (!needsBaseline())
    {
        return *this;
    }
    return ScoringStrategy(kind, baseline_score, true, comparator, name);
}

bool ScoringStrategy::needsBaseline() const
{
    return kind == ClosestToBaseline || kind == FarthestFromBaseline;
}

int ScoringStrategy::bestIndex(const std::vector<double> &scores) const
{
    if (scores.empty())
    {
        throw std::invalid_argument("Cannot pick the best of an empty score list");
    }
    if (!reference_bound)
    {
        throw std::logic_error("Strategy '" + name + "' has no baseline score bound yet");
    }

    switch (kind)
    {
    case ArgMin:
        return firstBest(scores, Identity(), false);
    case ArgMax:
        return firstBest(scores, Identity(), true);
    case ClosestTo:
    case ClosestToBaseline:
        return firstBest(scores, Deviation(reference), false);
    case FarthestFrom:
    case FarthestFromBaseline:
        return firstBest(scores, Deviation(reference), true);
    case Custom:
        return comparator(scores);
    }

    throw std::logic_error("Unhandled scoring strategy kind");
}

int ScoringStrategy::operator()(const std::vector<double> &scores) const
{
    return bestIndex(scores);
}

ScoringStrategy::Kind ScoringStrategy::getKind() const
{
    return kind;
}

double ScoringStrategy::getReference() const
{
    return reference;
}

std::string ScoringStrategy::getName() const
{
    return name;
}
