#ifndef PERFORMANCE_EVALUATOR_HPP
#define PERFORMANCE_EVALUATOR_HPP

#include <Eigen/Dense>
#include <string>

using namespace Eigen;

// Metrics comparing predictions against observed outputs, for building
// scoring functions
class PerformanceEvaluator
{
private:
    static void checkSizes(Index predicted, Index observed, const char *what);

public:
    // Regression
    static double calculateMSE(const VectorXd &predictions, const VectorXd &true_values);
    static double calculateMAE(const VectorXd &predictions, const VectorXd &true_values);

    // Binary classification (labels 0/1)
    static double calculateAccuracy(const VectorXi &predictions, const VectorXd &true_labels);
    static double calculateAUC(const VectorXd &probabilities, const VectorXd &true_labels);
    static double calculateDeviance(const VectorXd &probabilities, const VectorXd &true_labels);

    // Keeps p inside [eps, 1 - eps] so logs stay finite
    static double clipProbability(double p);

    // "mse", "mae", "accuracy", "auc" or "deviance". Classification metrics
    // read `predictions` as probabilities (accuracy thresholds at 0.5).
    static double calculateMetric(const std::string &metric, const VectorXd &predictions,
                                  const VectorXd &true_values);
};

#endif // PERFORMANCE_EVALUATOR_HPP
