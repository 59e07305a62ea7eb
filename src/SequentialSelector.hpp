#ifndef SEQUENTIAL_SELECTOR_HPP
#define SEQUENTIAL_SELECTOR_HPP

#include <ostream>
#include <string>
#include <vector>
#include "DataTable.hpp"
#include "ImportanceResult.hpp"
#include "RankAggregator.hpp"
#include "ScoringEngine.hpp"
#include "ScoringStrategy.hpp"
#include "SelectionStrategy.hpp"

class SequentialSelector
{
private:
    DataPair training_data;
    DataPair scoring_data;

    // Algorithm parameters
    std::vector<std::string> variable_names;
    int n_important_vars; // -1 = all variables
    int n_bootstrap;
    double subsample;
    int n_jobs;
    unsigned int seed;
    std::string method;

    // Progress reporting
    bool verbose;
    std::ostream *progress_stream;

    ScoreMap averageScores(const std::vector<ScoreMap> &passes) const;
    RankMap runRound(int round, const ScoringEngine &engine, const ScoringStrategy &scoring_strategy,
                     SelectionKind kind, const std::vector<std::string> &names,
                     const ImportantVariables &important, const SamplingPlan &sampling) const;

public:
    SequentialSelector(const DataPair &training, const DataPair &scoring);

    // Runs baseline scoring then one round per important variable requested
    ImportanceResult fit(const ScoringFunction &scoring_fn, const ScoringStrategy &scoring_strategy,
                         SelectionKind kind);
    ImportanceResult fit(const ScoringFunction &scoring_fn, const std::string &scoring_strategy,
                         SelectionKind kind);

    // Configuration methods
    void setVariableNames(const std::vector<std::string> &names);
    void setNumImportantVariables(int n_vars);
    void setBootstrap(int n_passes);
    void setSubsample(double value);
    void setNumJobs(int jobs);
    void setSeed(unsigned int random_seed);
    void setMethodName(const std::string &method_name);
    void setVerbose(bool enable);
    void setProgressStream(std::ostream &stream);

    int getNumImportantVariables() const;
    int getBootstrap() const;
    double getSubsample() const;
    int getNumJobs() const;
    unsigned int getSeed() const;

    // Values <= 1 are a fraction of n_rows, larger values an absolute count
    static int resolveSubsample(double value, int n_rows);

    // Values <= 0 are added to host_concurrency; result is at least 1
    static int resolveNumJobs(int jobs, int host_concurrency);

    static int hostConcurrency();
};

// Plain-struct form of the selector configuration
struct SelectionOptions
{
    std::vector<std::string> variable_names;
    int nimportant_vars;
    int nbootstrap;
    double subsample;
    int njobs;
    unsigned int seed;
    std::string method;
    bool verbose;

    SelectionOptions();
};

ImportanceResult sequentialSelection(const DataPair &training, const DataPair &scoring,
                                     const ScoringFunction &scoring_fn,
                                     const ScoringStrategy &scoring_strategy, SelectionKind kind,
                                     const SelectionOptions &options = SelectionOptions());

ImportanceResult sequentialForwardSelection(const DataPair &training, const DataPair &scoring,
                                            const ScoringFunction &scoring_fn,
                                            const ScoringStrategy &scoring_strategy,
                                            const SelectionOptions &options = SelectionOptions());
ImportanceResult sequentialForwardSelection(const DataPair &training, const DataPair &scoring,
                                            const ScoringFunction &scoring_fn,
                                            const std::string &scoring_strategy,
                                            const SelectionOptions &options = SelectionOptions());

ImportanceResult sequentialBackwardSelection(const DataPair &training, const DataPair &scoring,
                                             const ScoringFunction &scoring_fn,
                                             const ScoringStrategy &scoring_strategy,
                                             const SelectionOptions &options = SelectionOptions());
ImportanceResult sequentialBackwardSelection(const DataPair &training, const DataPair &scoring,
                                             const ScoringFunction &scoring_fn,
                                             const std::string &scoring_strategy,
                                             const SelectionOptions &options = SelectionOptions());

#endif // SEQUENTIAL_SELECTOR_HPP
