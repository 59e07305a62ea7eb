#include <algorithm>
#include <random>
#include <stdexcept>
#include "SelectionStrategy.hpp"
#include "SelectionExceptions.hpp"

using namespace std;

ImportantVariables::ImportantVariables()
{
}

ImportantVariables::ImportantVariables(const std::vector<int> &variable_indices)
{
    for (size_t i = 0; i < variable_indices.size(); ++i)
    {
        if (contains(variable_indices[i]))
        {
            throw std::invalid_argument("Variable " + to_string(variable_indices[i]) +
                                        " is already marked important");
        }
        indices.push_back(variable_indices[i]);
    }
}

ImportantVariables ImportantVariables::with(int variable_index) const
{
    std::vector<int> extended = indices;
    extended.push_back(variable_index);
    return ImportantVariables(extended);
}

bool ImportantVariables::contains(int variable_index) const
{
    return std::find(indices.begin(), indices.end(), variable_index) != indices.end();
}

int ImportantVariables::size() const
{
    return static_cast<int>(indices.size());
}

bool ImportantVariables::empty() const
{
    return indices.empty();
}

const std::vector<int> &ImportantVariables::getIndices() const
{
    return indices;
}

SamplingPlan::SamplingPlan() : subsample(0), resample(false), seed(0)
{
}

SamplingPlan::SamplingPlan(int n_rows, bool resample_rows, unsigned int random_seed)
    : subsample(n_rows), resample(resample_rows), seed(random_seed)
{
}

SelectionStrategy::SelectionStrategy(const DataPair &training, const DataPair &scoring, int n_vars,
                                     const ImportantVariables &important, int bootstrap_iter,
                                     const SamplingPlan &sampling)
    : training_data(training), scoring_data(scoring), num_vars(n_vars),
      important_vars(important), bootstrap_index(bootstrap_iter)
{
    if (!training.inputs || !scoring.inputs)
    {
        throw InvalidDataException("selection strategy needs both training and scoring inputs");
    }
    if (training.inputs->cols() != n_vars || scoring.inputs->cols() != n_vars)
    {
        throw InvalidDataException("training and scoring inputs must both have " + to_string(n_vars) + " columns");
    }
    for (size_t i = 0; i < important.getIndices().size(); ++i)
    {
        int var = important.getIndices()[i];
        if (var < 0 || var >= n_vars)
        {
            throw std::invalid_argument("Important variable " + to_string(var) + " is out of range");
        }
    }

    // One row draw per pass, shared by every candidate of the pass
    if (sampling.resample)
    {
        if (sampling.subsample <= 0 || training.rows() == 0)
        {
            throw InvalidDataException("subsample must draw at least one row from non-empty training data");
        }

        std::mt19937 rng(sampling.seed + static_cast<unsigned int>(bootstrap_iter));
        std::uniform_int_distribution<int> pick(0, training.rows() - 1);

        std::vector<int> rows(sampling.subsample);
        for (int i = 0; i < sampling.subsample; ++i)
        {
            rows[i] = pick(rng);
        }

        VectorXd sampled_outputs(sampling.subsample);
        for (int i = 0; i < sampling.subsample; ++i)
        {
            sampled_outputs(i) = training.outputs(rows[i]);
        }

        training_data = DataPair(training.inputs->subsetRows(rows), sampled_outputs);
    }
}

SelectionStrategy::~SelectionStrategy()
{
}

std::unique_ptr<SelectionStrategy> SelectionStrategy::create(SelectionKind kind,
                                                             const DataPair &training, const DataPair &scoring,
                                                             int n_vars, const ImportantVariables &important,
                                                             int bootstrap_iter, const SamplingPlan &sampling)
{
    switch (kind)
    {
    case SelectionKind::Forward:
        return std::unique_ptr<SelectionStrategy>(new SequentialForwardSelectionStrategy(
            training, scoring, n_vars, important, bootstrap_iter, sampling));
    case SelectionKind::Backward:
        return std::unique_ptr<SelectionStrategy>(new SequentialBackwardSelectionStrategy(
            training, scoring, n_vars, important, bootstrap_iter, sampling));
    }
    throw std::logic_error("Unhandled selection kind");
}

int SelectionStrategy::getNumVars() const
{
    return num_vars;
}

std::vector<int> SelectionStrategy::getCandidates() const
{
    std::vector<int> candidates;
    for (int var = 0; var < num_vars; ++var)
    {
        if (!important_vars.contains(var))
        {
            candidates.push_back(var);
        }
    }
    return candidates;
}

std::pair<DataPair, DataPair> SelectionStrategy::generateDatasets(const std::vector<int> &extra_vars) const
{
    std::vector<int> considered = important_vars.getIndices();
    considered.insert(considered.end(), extra_vars.begin(), extra_vars.end());

    std::vector<int> columns = columnsFor(considered);

    DataPair training(training_data.inputs->subsetColumns(columns), training_data.outputs);
    DataPair scoring(scoring_data.inputs->subsetColumns(columns), scoring_data.outputs);
    return std::make_pair(training, scoring);
}

CandidateTriple SelectionStrategy::generateCandidate(int variable) const
{
    if (variable < 0 || variable >= num_vars || important_vars.contains(variable))
    {
        throw std::invalid_argument("Variable " + to_string(variable) + " is not a candidate");
    }

    std::pair<DataPair, DataPair> datasets = generateDatasets(std::vector<int>(1, variable));

    CandidateTriple triple;
    triple.variable = variable;
    triple.training = datasets.first;
    triple.scoring = datasets.second;
    return triple;
}

const ImportantVariables &SelectionStrategy::getImportantVariables() const
{
    return important_vars;
}

int SelectionStrategy::getBootstrapIndex() const
{
    return bootstrap_index;
}

SequentialForwardSelectionStrategy::SequentialForwardSelectionStrategy(
    const DataPair &training, const DataPair &scoring, int n_vars,
    const ImportantVariables &important, int bootstrap_iter, const SamplingPlan &sampling)
    : SelectionStrategy(training, scoring, n_vars, important, bootstrap_iter, sampling)
{
}

std::vector<int> SequentialForwardSelectionStrategy::columnsFor(const std::vector<int> &considered) const
{
    std::vector<int> columns = considered;
    std::sort(columns.begin(), columns.end());
    return columns;
}

std::string SequentialForwardSelectionStrategy::getName() const
{
    return "sequential_forward_selection";
}

SequentialBackwardSelectionStrategy::SequentialBackwardSelectionStrategy(
    const DataPair &training, const DataPair &scoring, int n_vars,
    const ImportantVariables &important, int bootstrap_iter, const SamplingPlan &sampling)
    : SelectionStrategy(training, scoring, n_vars, important, bootstrap_iter, sampling)
{
}

std::vector<int> SequentialBackwardSelectionStrategy::columnsFor(const std::vector<int> &considered) const
{
    std::vector<int> columns;
    for (int var = 0; var < getNumVars(); ++var)
    {
        if (std::find(considered.begin(), considered.end(), var) == considered.end())
        {
            columns.push_back(var);
        }
    }
    return columns;
}

std::string SequentialBackwardSelectionStrategy::getName() const
{
    return "sequential_backward_selection";
}

std::string selectionKindName(SelectionKind kind)
{
    switch (kind)
    {
    case SelectionKind::Forward:
        return "sequential_forward_selection";
    case SelectionKind::Backward:
        return "sequential_backward_selection";
    }
    throw std::logic_error("Unhandled selection kind");
}
