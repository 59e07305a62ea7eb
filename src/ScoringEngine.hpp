#ifndef SCORING_ENGINE_HPP
#define SCORING_ENGINE_HPP

#include <functional>
#include <map>
#include "DataTable.hpp"
#include "SelectionStrategy.hpp"

// (training subset, scoring subset) -> score. Must be safe to call concurrently.
typedef std::function<double(const DataPair &, const DataPair &)> ScoringFunction;

// variable index -> score, ordered by variable index
typedef std::map<int, double> ScoreMap;

class ScoringEngine
{
private:
    ScoringFunction scoring_fn;
    int n_jobs;

    ScoreMap scoreSerial(const SelectionStrategy &strategy) const;
    ScoreMap scoreParallel(const SelectionStrategy &strategy) const;

public:
    ScoringEngine(const ScoringFunction &scoring_function, int num_jobs);

    // Calls scoring_fn exactly once per candidate of `strategy`.
    // A throwing scoring_fn surfaces as WorkerFailureException.
    ScoreMap scoreCandidates(const SelectionStrategy &strategy) const;

    int getNumJobs() const;
};

#endif // SCORING_ENGINE_HPP
