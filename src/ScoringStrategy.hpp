#ifndef SCORING_STRATEGY_HPP
#define SCORING_STRATEGY_HPP

#include <functional>
#include <string>
#include <vector>

// Rule picking the "best" entry of a sequence of scores. The kind is fixed
// at construction; ties always go to the earliest index.
class ScoringStrategy
{
public:
    enum Kind
    {
        ArgMin,
        ArgMax,
        ClosestTo,    // smallest |score - reference|
        FarthestFrom, // largest |score - reference|
        ClosestToBaseline,    // ClosestTo with the run's baseline score as reference
        FarthestFromBaseline, // FarthestFrom with the run's baseline score as reference
        Custom
    };

    typedef std::function<int(const std::vector<double> &)> Comparator;

private:
    Kind kind;
    double reference;
    bool reference_bound;
    Comparator comparator;
    std::string name;

    ScoringStrategy(Kind strategy_kind, double reference_value, bool bound,
                    const Comparator &custom_comparator, const std::string &strategy_name);

public:
    // Recognized: "min", "argmin", "max", "argmax", "argmin_of_abs", "argmax_of_abs",
    // "closest_to_baseline", "farthest_from_baseline"
    static ScoringStrategy fromName(const std::string &strategy_name);

    static ScoringStrategy argMin();
    static ScoringStrategy argMax();
    static ScoringStrategy closestTo(double reference_value);
    static ScoringStrategy farthestFrom(double reference_value);
    static ScoringStrategy closestToBaseline();
    static ScoringStrategy farthestFromBaseline();
    static ScoringStrategy custom(const Comparator &custom_comparator,
                                  const std::string &strategy_name = "custom");

    // Copy with the baseline score as reference. Other kinds come back unchanged.
    ScoringStrategy withBaseline(double baseline_score) const;
    bool needsBaseline() const;

    // Index of the best score. Throws std::invalid_argument on empty input
    // and std::logic_error for a baseline kind with no baseline bound.
    int bestIndex(const std::vector<double> &scores) const;
    int operator()(const std::vector<double> &scores) const;

    Kind getKind() const;
    double getReference() const;
    std::string getName() const;
};

#endif // SCORING_STRATEGY_HPP
