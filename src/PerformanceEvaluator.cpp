#include <vector>
#include <algorithm>
#include <cmath>
#include <cfloat>
#include <stdexcept>
#include "PerformanceEvaluator.hpp"

using namespace std;

void PerformanceEvaluator::checkSizes(Index predicted, Index observed, const char *what)
{
    if (predicted != observed)
    {
        throw std::invalid_argument(std::string(what) + " and true values must have the same size");
    }
    if (observed == 0)
    {
        throw std::invalid_argument("Cannot evaluate a metric over zero observations");
    }
}

double PerformanceEvaluator::calculateMSE(const VectorXd &predictions, const VectorXd &true_values)
{
    checkSizes(predictions.size(), true_values.size(), "Predictions");
    return (predictions - true_values).squaredNorm() / predictions.size();
}

double PerformanceEvaluator::calculateMAE(const VectorXd &predictions, const VectorXd &true_values)
{
    checkSizes(predictions.size(), true_values.size(), "Predictions");
    return (predictions - true_values).cwiseAbs().sum() / predictions.size();
}

double PerformanceEvaluator::calculateAccuracy(const VectorXi &predictions, const VectorXd &true_labels)
{
    checkSizes(predictions.size(), true_labels.size(), "Predictions");

    int correct = 0;
    for (Index i = 0; i < predictions.size(); ++i)
    {
        if (predictions(i) == static_cast<int>(true_labels(i)))
        {
            correct++;
        }
    }

    return static_cast<double>(correct) / predictions.size();
}

double PerformanceEvaluator::clipProbability(double p)
{
    return std::min(std::max(p, DBL_EPSILON), 1.0 - DBL_EPSILON);
}

// Mann-Whitney form: tied probabilities share their average rank, so a
// positive tied with a negative counts as half a correct ordering
double PerformanceEvaluator::calculateAUC(const VectorXd &probabilities, const VectorXd &true_labels)
{
    checkSizes(probabilities.size(), true_labels.size(), "Probabilities");

    Index n = probabilities.size();
    vector<Index> order(n);
    for (Index i = 0; i < n; ++i)
    {
        order[i] = i;
    }
    sort(order.begin(), order.end(),
         [&probabilities](Index a, Index b) { return probabilities(a) < probabilities(b); });

    double positive_rank_sum = 0.0;
    double n_pos = 0.0;
    Index first = 0;
    while (first < n)
    {
        Index last = first;
        while (last + 1 < n && probabilities(order[last + 1]) == probabilities(order[first]))
        {
            ++last;
        }

        // Ranks are 1-based
        double shared_rank = 0.5 * static_cast<double>(first + last) + 1.0;
        for (Index k = first; k <= last; ++k)
        {
            if (true_labels(order[k]) == 1.0)
            {
                positive_rank_sum += shared_rank;
                n_pos += 1.0;
            }
        }
        first = last + 1;
    }

    double n_neg = static_cast<double>(n) - n_pos;
    if (n_pos == 0.0 || n_neg == 0.0)
    {
        return 0.5;
    }

    return (positive_rank_sum - n_pos * (n_pos + 1.0) / 2.0) / (n_pos * n_neg);
}

double PerformanceEvaluator::calculateDeviance(const VectorXd &probabilities, const VectorXd &true_labels)
{
    checkSizes(probabilities.size(), true_labels.size(), "Probabilities");

    VectorXd likelihood(probabilities.size());
    for (Index i = 0; i < probabilities.size(); ++i)
    {
        double p = clipProbability(probabilities(i));
        likelihood(i) = (true_labels(i) == 1.0) ? p : 1.0 - p;
    }

    return -2.0 * likelihood.array().log().sum();
}

double PerformanceEvaluator::calculateMetric(const std::string &metric, const VectorXd &predictions,
                                             const VectorXd &true_values)
{
    if (metric == "mse")
    {
        return calculateMSE(predictions, true_values);
    }
    else if (metric == "mae")
    {
        return calculateMAE(predictions, true_values);
    }
    else if (metric == "accuracy")
    {
        VectorXi classes = (predictions.array() >= 0.5).cast<int>().matrix();
        return calculateAccuracy(classes, true_values);
    }
    else if (metric == "auc")
    {
        return calculateAUC(predictions, true_values);
    }
    else if (metric == "deviance")
    {
        return calculateDeviance(predictions, true_values);
    }
    else
    {
        throw std::invalid_argument("Unknown metric: " + metric + ". Use 'mse', 'mae', 'accuracy', 'auc', or 'deviance'");
    }
}
