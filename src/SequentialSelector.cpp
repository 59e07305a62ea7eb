#include <iostream>
#include <iomanip>
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <thread>
#ifdef _OPENMP
#include <omp.h>
#endif
#include "SequentialSelector.hpp"
#include "DataVerification.hpp"
#include "SelectionExceptions.hpp"

using namespace std;

// Constructor
SequentialSelector::SequentialSelector(const DataPair &training, const DataPair &scoring)
    : training_data(training), scoring_data(scoring), n_important_vars(-1),
      n_bootstrap(1), subsample(1.0), n_jobs(1), seed(0),
      verbose(false), progress_stream(&std::cout)
{
}

int SequentialSelector::resolveSubsample(double value, int n_rows)
{
    if (!(value > 0.0))
    {
        throw InvalidDataException("subsample must be positive");
    }

    if (value > static_cast<double>(std::numeric_limits<int>::max()))
    {
        throw InvalidDataException("subsample count " + to_string(value) + " is out of range");
    }

    int resolved = (value <= 1.0) ? static_cast<int>(n_rows * value) : static_cast<int>(value);
    if (resolved < 1)
    {
        throw InvalidDataException("subsample of " + to_string(value) + " over " + to_string(n_rows) +
                                   " rows selects no rows");
    }
    return resolved;
}

int SequentialSelector::resolveNumJobs(int jobs, int host_concurrency)
{
    int resolved = (jobs <= 0) ? host_concurrency + jobs : jobs;
    return std::max(resolved, 1);
}

int SequentialSelector::hostConcurrency()
{
#ifdef _OPENMP
    return omp_get_num_procs();
#else
    unsigned int n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : static_cast<int>(n);
#endif
}

ImportanceResult SequentialSelector::fit(const ScoringFunction &scoring_fn, const std::string &scoring_strategy,
                                         SelectionKind kind)
{
    return fit(scoring_fn, ScoringStrategy::fromName(scoring_strategy), kind);
}

ImportanceResult SequentialSelector::fit(const ScoringFunction &scoring_fn, const ScoringStrategy &scoring_strategy,
                                         SelectionKind kind)
{
    // Validate everything before the first scoring call
    DataPair training = verifyData(training_data);
    DataPair scoring = verifyData(scoring_data);

    if (training.inputs->cols() != scoring.inputs->cols())
    {
        throw InvalidDataException("training and scoring inputs must have the same number of columns");
    }

    std::vector<std::string> names = determineVariableNames(training, variable_names);
    int num_vars = static_cast<int>(names.size());
    int n_rounds = (n_important_vars < 0) ? num_vars : n_important_vars;

    if (n_rounds > num_vars)
    {
        throw ExhaustedCandidatesException("requested " + to_string(n_rounds) + " rounds but only " +
                                           to_string(num_vars) + " variables are available");
    }

    int n_samples = resolveSubsample(subsample, training.rows());
    SamplingPlan sampling(n_samples, n_bootstrap > 1 || n_samples != training.rows(), seed);

    int jobs = resolveNumJobs(n_jobs, hostConcurrency());
    ScoringEngine engine(scoring_fn, jobs);

    std::string method_name = method.empty() ? selectionKindName(kind) : method;

    // Baseline: nothing marked important
    ImportantVariables important;
    std::unique_ptr<SelectionStrategy> baseline_strategy =
        SelectionStrategy::create(kind, training, scoring, num_vars, important, 0, sampling);
    std::pair<DataPair, DataPair> baseline_data = baseline_strategy->generateDatasets(std::vector<int>());
    double original_score = scoring_fn(baseline_data.first, baseline_data.second);

    ImportanceResult result(method_name, names, original_score);
    ScoringStrategy round_strategy = scoring_strategy.withBaseline(original_score);

    for (int round = 0; round < n_rounds; ++round)
    {
        if (important.size() >= num_vars)
        {
            throw ExhaustedCandidatesException("no candidates left for round " + to_string(round + 1));
        }

        RankMap ranks = runRound(round, engine, round_strategy, kind, names, important, sampling);

        std::string best_var = RankAggregator::bestVariable(ranks);
        int best_index = static_cast<int>(std::find(names.begin(), names.end(), best_var) - names.begin());

        result.addNewResults(ranks, best_var);
        important = important.with(best_index);

        if (verbose)
        {
            *progress_stream << "\rRound " << (round + 1) << " / " << n_rounds
                             << ": selected " << best_var
                             << " (score " << ranks[best_var].score << ")    \n"
                             << std::flush;
        }
    }

    return result;
}

RankMap SequentialSelector::runRound(int round, const ScoringEngine &engine, const ScoringStrategy &scoring_strategy,
                                     SelectionKind kind, const std::vector<std::string> &names,
                                     const ImportantVariables &important, const SamplingPlan &sampling) const
{
    int num_vars = static_cast<int>(names.size());
    std::vector<ScoreMap> passes;
    passes.reserve(n_bootstrap);

    // Passes run one after another so the average is reproducible
    for (int b = 0; b < n_bootstrap; ++b)
    {
        std::unique_ptr<SelectionStrategy> strategy =
            SelectionStrategy::create(kind, training_data, scoring_data, num_vars, important, b, sampling);
        passes.push_back(engine.scoreCandidates(*strategy));

        if (verbose)
        {
            int pct = static_cast<int>((100.0 * (b + 1)) / n_bootstrap);
            *progress_stream << "\rRound " << (round + 1) << ": evaluated " << (b + 1) << " / " << n_bootstrap
                             << " passes (" << pct << "%)" << std::flush;
        }
    }

    return RankAggregator::rank(averageScores(passes), names, scoring_strategy);
}

ScoreMap SequentialSelector::averageScores(const std::vector<ScoreMap> &passes) const
{
    ScoreMap averaged;
    if (passes.empty())
    {
        return averaged;
    }

    for (size_t p = 1; p < passes.size(); ++p)
    {
        if (passes[p].size() != passes[0].size() ||
            !std::equal(passes[p].begin(), passes[p].end(), passes[0].begin(),
                        [](const ScoreMap::value_type &a, const ScoreMap::value_type &b)
                        { return a.first == b.first; }))
        {
            throw std::logic_error("Bootstrap passes enumerated different candidate variables");
        }
    }

    for (ScoreMap::const_iterator it = passes[0].begin(); it != passes[0].end(); ++it)
    {
        double total = 0.0;
        for (size_t p = 0; p < passes.size(); ++p)
        {
            total += passes[p].find(it->first)->second;
        }
        averaged[it->first] = total / passes.size();
    }

    return averaged;
}

// Configuration methods
void SequentialSelector::setVariableNames(const std::vector<std::string> &names)
{
    variable_names = names;
}

void SequentialSelector::setNumImportantVariables(int n_vars)
{
    if (n_vars < -1)
    {
        throw std::invalid_argument("Number of important variables must be -1 (all) or non-negative");
    }
    n_important_vars = n_vars;
}

void SequentialSelector::setBootstrap(int n_passes)
{
    if (n_passes < 1)
    {
        throw std::invalid_argument("Number of bootstrap passes must be at least 1");
    }
    n_bootstrap = n_passes;
}

void SequentialSelector::setSubsample(double value)
{
    if (!(value > 0.0))
    {
        throw std::invalid_argument("Subsample must be a positive fraction or count");
    }
    subsample = value;
}

void SequentialSelector::setNumJobs(int jobs)
{
    n_jobs = jobs;
}

void SequentialSelector::setSeed(unsigned int random_seed)
{
    seed = random_seed;
}

void SequentialSelector::setMethodName(const std::string &method_name)
{
    method = method_name;
}

void SequentialSelector::setVerbose(bool enable)
{
    verbose = enable;
}

void SequentialSelector::setProgressStream(std::ostream &stream)
{
    progress_stream = &stream;
}

int SequentialSelector::getNumImportantVariables() const
{
    return n_important_vars;
}

int SequentialSelector::getBootstrap() const
{
    return n_bootstrap;
}

double SequentialSelector::getSubsample() const
{
    return subsample;
}

int SequentialSelector::getNumJobs() const
{
    return n_jobs;
}

unsigned int SequentialSelector::getSeed() const
{
    return seed;
}

SelectionOptions::SelectionOptions()
    : nimportant_vars(-1), nbootstrap(1), subsample(1.0), njobs(1), seed(0), verbose(false)
{
}

ImportanceResult sequentialSelection(const DataPair &training, const DataPair &scoring,
                                     const ScoringFunction &scoring_fn,
                                     const ScoringStrategy &scoring_strategy, SelectionKind kind,
                                     const SelectionOptions &options)
{
    SequentialSelector selector(training, scoring);

    selector.setVariableNames(options.variable_names);
    selector.setNumImportantVariables(options.nimportant_vars);
    selector.setBootstrap(options.nbootstrap);
    selector.setSubsample(options.subsample);
    selector.setNumJobs(options.njobs);
    selector.setSeed(options.seed);
    selector.setMethodName(options.method);
    selector.setVerbose(options.verbose);

    return selector.fit(scoring_fn, scoring_strategy, kind);
}

ImportanceResult sequentialForwardSelection(const DataPair &training, const DataPair &scoring,
                                            const ScoringFunction &scoring_fn,
                                            const ScoringStrategy &scoring_strategy,
                                            const SelectionOptions &options)
{
    return sequentialSelection(training, scoring, scoring_fn, scoring_strategy, SelectionKind::Forward, options);
}

ImportanceResult sequentialForwardSelection(const DataPair &training, const DataPair &scoring,
                                            const ScoringFunction &scoring_fn,
                                            const std::string &scoring_strategy,
                                            const SelectionOptions &options)
{
    return sequentialSelection(training, scoring, scoring_fn, ScoringStrategy::fromName(scoring_strategy),
                               SelectionKind::Forward, options);
}

ImportanceResult sequentialBackwardSelection(const DataPair &training, const DataPair &scoring,
                                             const ScoringFunction &scoring_fn,
                                             const ScoringStrategy &scoring_strategy,
                                             const SelectionOptions &options)
{
    return sequentialSelection(training, scoring, scoring_fn, scoring_strategy, SelectionKind::Backward, options);
}

ImportanceResult sequentialBackwardSelection(const DataPair &training, const DataPair &scoring,
                                             const ScoringFunction &scoring_fn,
                                             const std::string &scoring_strategy,
                                             const SelectionOptions &options)
{
    return sequentialSelection(training, scoring, scoring_fn, ScoringStrategy::fromName(scoring_strategy),
                               SelectionKind::Backward, options);
}
