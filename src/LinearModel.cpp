#include <cmath>
#include <algorithm>
#include <stdexcept>
#include "LinearModel.hpp"
#include "PerformanceEvaluator.hpp"
#include "SelectionExceptions.hpp"

using namespace std;

// Default constructor
LinearModel::LinearModel() : intercept(0.0), logistic_link(false)
{
}

LinearModel::LinearModel(const std::vector<std::string> &names, const VectorXd &coeffs,
                         double intercept_value, bool use_logistic_link)
    : variable_names(names), coefficients(coeffs), intercept(intercept_value),
      logistic_link(use_logistic_link)
{
    if (static_cast<Index>(names.size()) != coeffs.size())
    {
        throw std::invalid_argument("Number of variable names must match number of coefficients");
    }
}

double LinearModel::coefficientFor(const std::string &name) const
{
    for (size_t i = 0; i < variable_names.size(); ++i)
    {
        if (variable_names[i] == name)
        {
            return coefficients(i);
        }
    }
    throw InvalidDataException("model has no coefficient for column '" + name + "'");
}

VectorXd LinearModel::predict(const DataTable &inputs) const
{
    VectorXd eta = VectorXd::Constant(inputs.rows(), intercept);

    if (inputs.hasColumnNames())
    {
        std::vector<std::string> columns = inputs.getColumnNames();
        for (size_t j = 0; j < columns.size(); ++j)
        {
            eta += coefficientFor(columns[j]) * inputs.getValues().col(j);
        }
    }
    else if (inputs.cols() == coefficients.size())
    {
        // Unnamed columns are matched by position
        eta += inputs.getValues() * coefficients;
    }
    else
    {
        throw InvalidDataException("unnamed table with " + to_string(inputs.cols()) +
                                   " columns cannot be matched to " + to_string(coefficients.size()) +
                                   " coefficients");
    }

    if (!logistic_link)
    {
        return eta;
    }

    VectorXd probs(eta.size());
    for (Index i = 0; i < eta.size(); ++i)
    {
        // Numerically stable logistic function
        double p;
        if (eta(i) >= 0)
        {
            p = 1.0 / (1.0 + std::exp(-eta(i)));
        }
        else
        {
            double e = std::exp(eta(i));
            p = e / (1.0 + e);
        }
        probs(i) = PerformanceEvaluator::clipProbability(p);
    }

    return probs;
}

VectorXi LinearModel::predictClass(const DataTable &inputs) const
{
    if (!logistic_link)
    {
        throw std::runtime_error("Class predictions need a model with the logistic link");
    }

    VectorXd probs = predict(inputs);
    VectorXi predictions(probs.size());
    for (Index i = 0; i < probs.size(); ++i)
    {
        predictions(i) = (probs(i) >= 0.5) ? 1 : 0;
    }

    return predictions;
}

// Getters
std::vector<std::string> LinearModel::getVariableNames() const
{
    return variable_names;
}

VectorXd LinearModel::getCoefficients() const
{
    return coefficients;
}

double LinearModel::getIntercept() const
{
    return intercept;
}

bool LinearModel::usesLogisticLink() const
{
    return logistic_link;
}
