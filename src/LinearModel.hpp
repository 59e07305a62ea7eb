#ifndef LINEAR_MODEL_HPP
#define LINEAR_MODEL_HPP

#include <Eigen/Dense>
#include <string>
#include <vector>
#include "DataTable.hpp"

using namespace Eigen;

// Pre-fitted linear predictor. Coefficients are keyed by variable name, so a
// table holding only some of the variables can still be scored: missing
// columns contribute nothing to the linear predictor.
class LinearModel
{
private:
    std::vector<std::string> variable_names;
    VectorXd coefficients;
    double intercept;
    bool logistic_link;

    double coefficientFor(const std::string &name) const;

public:
    LinearModel();
    LinearModel(const std::vector<std::string> &names, const VectorXd &coeffs,
                double intercept_value = 0.0, bool use_logistic_link = false);

    // Linear predictor, or probabilities with the logistic link
    VectorXd predict(const DataTable &inputs) const;

    // 0/1 classes at probability 0.5; logistic link only
    VectorXi predictClass(const DataTable &inputs) const;

    // Getters
    std::vector<std::string> getVariableNames() const;
    VectorXd getCoefficients() const;
    double getIntercept() const;
    bool usesLogisticLink() const;
};

#endif // LINEAR_MODEL_HPP
