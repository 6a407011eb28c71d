#pragma once

#include <optional>
#include <vector>

struct MetricSummary {
    double rmse = 0.0;
    double meanAbsoluteError = 0.0;
    double medianAbsoluteError = 0.0;
    std::optional<double> rSquared;
};

namespace ErrorMetrics {
using Matrix = std::vector<std::vector<double>>;

/**
 * @brief Root-mean-squared error sqrt(mean((predicted - actual)^2)).
 * @throws Plateau::EmptyInputException when either sequence is empty.
 * @throws Plateau::DimensionMismatchException when lengths differ.
 */
double rmse(const std::vector<double>& predicted, const std::vector<double>& actual);
double rmse(const Matrix& predicted, const Matrix& actual);

double meanAbsoluteError(const std::vector<double>& predicted, const std::vector<double>& actual);
double meanAbsoluteError(const Matrix& predicted, const Matrix& actual);

double medianAbsoluteError(const std::vector<double>& predicted, const std::vector<double>& actual);
double medianAbsoluteError(const Matrix& predicted, const Matrix& actual);

/**
 * @brief Coefficient of determination 1 - SS_res / SS_tot.
 * @post Returns 1.0 when actual values are constant and predictions are exact.
 * @throws Plateau::UndefinedMetricException when actual values are constant and SS_res > 0.
 */
double rSquared(const std::vector<double>& predicted, const std::vector<double>& actual);
double rSquared(const Matrix& predicted, const Matrix& actual);

/**
 * @brief All four metrics at once; rSquared is empty when undefined.
 */
MetricSummary summarize(const Matrix& predicted, const Matrix& actual);

/**
 * @brief Flattens a row-major matrix after checking it matches `reference` in shape.
 * @throws Plateau::DimensionMismatchException on ragged or mismatched shapes.
 */
std::vector<double> flattenMatching(const Matrix& values, const Matrix& reference);
}
