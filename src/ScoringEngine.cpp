#include <atomic>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#ifdef _OPENMP
#include <omp.h>
#endif
#include "ScoringEngine.hpp"
#include "BoundedChannel.hpp"
#include "SelectionExceptions.hpp"

using namespace std;

namespace
{
    // First failure seen by any worker; later ones are dropped
    class FailureSlot
    {
    private:
        std::mutex mutex;
        bool failed;
        int variable;
        std::string message;

    public:
        FailureSlot() : failed(false), variable(-1) {}

        void record(int var, const std::string &what)
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!failed)
            {
                failed = true;
                variable = var;
                message = what;
            }
        }

        void rethrowIfFailed()
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (failed)
            {
                throw WorkerFailureException(variable, message);
            }
        }
    };

    void insertScore(ScoreMap &scores, int variable, double score)
    {
        if (!scores.insert(std::make_pair(variable, score)).second)
        {
            throw std::logic_error("Variable " + to_string(variable) + " was scored twice in one pass");
        }
    }
}

ScoringEngine::ScoringEngine(const ScoringFunction &scoring_function, int num_jobs)
    : scoring_fn(scoring_function), n_jobs(num_jobs)
{
    if (!scoring_fn)
    {
        throw std::invalid_argument("Scoring function must not be empty");
    }
    if (n_jobs < 1)
    {
        throw std::invalid_argument("Number of jobs must be at least 1");
    }
}

int ScoringEngine::getNumJobs() const
{
    return n_jobs;
}

ScoreMap ScoringEngine::scoreCandidates(const SelectionStrategy &strategy) const
{
    if (n_jobs == 1)
    {
        return scoreSerial(strategy);
    }
    return scoreParallel(strategy);
}

ScoreMap ScoringEngine::scoreSerial(const SelectionStrategy &strategy) const
{
    ScoreMap scores;
    std::vector<int> candidates = strategy.getCandidates();

    for (size_t i = 0; i < candidates.size(); ++i)
    {
        CandidateTriple triple = strategy.generateCandidate(candidates[i]);

        double score;
        try
        {
            score = scoring_fn(triple.training, triple.scoring);
        }
        catch (const std::exception &e)
        {
            throw WorkerFailureException(triple.variable, e.what());
        }
        catch (...)
        {
            throw WorkerFailureException(triple.variable, "unknown exception");
        }

        insertScore(scores, triple.variable, score);
    }

    return scores;
}

// One producer thread materializes triples into a task channel bounded at
// n_jobs entries; the remaining threads score them. Any scoring failure
// cancels both channels so nobody blocks on work that will never arrive.
ScoreMap ScoringEngine::scoreParallel(const SelectionStrategy &strategy) const
{
#ifdef _OPENMP
    std::vector<int> candidates = strategy.getCandidates();

    BoundedChannel<CandidateTriple> tasks(static_cast<std::size_t>(n_jobs));
    BoundedChannel<std::pair<int, double>> results;
    FailureSlot failure;
    std::exception_ptr producer_error;
    std::atomic<bool> aborted(false);

#pragma omp parallel num_threads(n_jobs + 1)
    {
        int thread_id = omp_get_thread_num();
        int n_threads = omp_get_num_threads();

        if (thread_id == 0)
        {
            try
            {
                for (size_t i = 0; i < candidates.size() && !aborted; ++i)
                {
                    CandidateTriple triple = strategy.generateCandidate(candidates[i]);

                    if (n_threads == 1)
                    {
                        // Runtime gave us no workers: score in place
                        try
                        {
                            double score = scoring_fn(triple.training, triple.scoring);
                            results.push(std::make_pair(triple.variable, score));
                        }
                        catch (const std::exception &e)
                        {
                            failure.record(triple.variable, e.what());
                            aborted = true;
                        }
                        catch (...)
                        {
                            failure.record(triple.variable, "unknown exception");
                            aborted = true;
                        }
                    }
                    else if (!tasks.push(std::move(triple)))
                    {
                        break;
                    }
                }
            }
            catch (...)
            {
                producer_error = std::current_exception();
                aborted = true;
                tasks.cancel();
            }
            tasks.close();
        }
        else
        {
            CandidateTriple triple;
            while (tasks.pop(triple))
            {
                try
                {
                    double score = scoring_fn(triple.training, triple.scoring);
                    results.push(std::make_pair(triple.variable, score));
                }
                catch (const std::exception &e)
                {
                    failure.record(triple.variable, e.what());
                    aborted = true;
                    tasks.cancel();
                }
                catch (...)
                {
                    failure.record(triple.variable, "unknown exception");
                    aborted = true;
                    tasks.cancel();
                }
            }
        }
    }

    if (producer_error)
    {
        std::rethrow_exception(producer_error);
    }
    failure.rethrowIfFailed();

    results.close();
    ScoreMap scores;
    std::pair<int, double> entry;
    while (results.pop(entry))
    {
        insertScore(scores, entry.first, entry.second);
    }

    if (scores.size() != candidates.size())
    {
        throw std::logic_error("Scored " + to_string(scores.size()) + " of " +
                               to_string(candidates.size()) + " candidates");
    }

    return scores;
#else
    return scoreSerial(strategy);
#endif
}
