#ifndef SELECTION_STRATEGY_HPP
#define SELECTION_STRATEGY_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "DataTable.hpp"

enum class SelectionKind
{
    Forward,
    Backward
};

// Ordered, duplicate-free list of variable indices already selected.
// Values are never modified in place; with() returns the extended list.
class ImportantVariables
{
private:
    std::vector<int> indices;

public:
    ImportantVariables();
    explicit ImportantVariables(const std::vector<int> &variable_indices);

    ImportantVariables with(int variable_index) const;
    bool contains(int variable_index) const;
    int size() const;
    bool empty() const;
    const std::vector<int> &getIndices() const;
};

// How training rows are drawn for one bootstrap pass
struct SamplingPlan
{
    int subsample;      // rows drawn per pass
    bool resample;      // false: use every training row as-is
    unsigned int seed;

    SamplingPlan();
    SamplingPlan(int n_rows, bool resample_rows, unsigned int random_seed);
};

struct CandidateTriple
{
    int variable;
    DataPair training;
    DataPair scoring;
};

// Produces the (variable, training subset, scoring subset) triples of one
// bootstrap pass. Candidates are listed in ascending variable order and the
// same arguments always give the same triples.
class SelectionStrategy
{
private:
    DataPair training_data;
    DataPair scoring_data;
    int num_vars;
    ImportantVariables important_vars;
    int bootstrap_index;

protected:
    // Columns kept when `considered` are marked important (ascending order)
    virtual std::vector<int> columnsFor(const std::vector<int> &considered) const = 0;

    int getNumVars() const;

public:
    SelectionStrategy(const DataPair &training, const DataPair &scoring, int n_vars,
                      const ImportantVariables &important, int bootstrap_iter,
                      const SamplingPlan &sampling);
    virtual ~SelectionStrategy();

    static std::unique_ptr<SelectionStrategy> create(SelectionKind kind,
                                                     const DataPair &training, const DataPair &scoring,
                                                     int n_vars, const ImportantVariables &important,
                                                     int bootstrap_iter, const SamplingPlan &sampling);

    virtual std::string getName() const = 0;

    // Variables not yet marked important
    std::vector<int> getCandidates() const;

    // Datasets with the current important variables plus `extra_vars`
    std::pair<DataPair, DataPair> generateDatasets(const std::vector<int> &extra_vars) const;

    CandidateTriple generateCandidate(int variable) const;

    const ImportantVariables &getImportantVariables() const;
    int getBootstrapIndex() const;
};

// Candidate subsets hold the important variables plus the candidate
class SequentialForwardSelectionStrategy : public SelectionStrategy
{
protected:
    std::vector<int> columnsFor(const std::vector<int> &considered) const;

public:
    SequentialForwardSelectionStrategy(const DataPair &training, const DataPair &scoring, int n_vars,
                                       const ImportantVariables &important, int bootstrap_iter,
                                       const SamplingPlan &sampling);

    std::string getName() const;
};

// Candidate subsets hold every variable except the important ones and the candidate
class SequentialBackwardSelectionStrategy : public SelectionStrategy
{
protected:
    std::vector<int> columnsFor(const std::vector<int> &considered) const;

public:
    SequentialBackwardSelectionStrategy(const DataPair &training, const DataPair &scoring, int n_vars,
                                        const ImportantVariables &important, int bootstrap_iter,
                                        const SamplingPlan &sampling);

    std::string getName() const;
};

std::string selectionKindName(SelectionKind kind);

#endif // SELECTION_STRATEGY_HPP
