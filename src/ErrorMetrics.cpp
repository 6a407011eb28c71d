#include "ErrorMetrics.h"
#include "CommonUtils.h"
#include "PlateauExceptions.h"

#include <cmath>
#include <numeric>
#include <string>

namespace {
void checkPair(const std::vector<double>& predicted, const std::vector<double>& actual, const char* metric) {
    if (predicted.empty() || actual.empty()) {
        throw Plateau::EmptyInputException(std::string(metric) + " requires at least one value");
    }
    if (predicted.size() != actual.size()) {
        throw Plateau::DimensionMismatchException(std::string(metric) + ": " + std::to_string(predicted.size()) +
                                                  " predictions vs " + std::to_string(actual.size()) + " actual values");
    }
}

std::vector<double> absoluteErrors(const std::vector<double>& predicted, const std::vector<double>& actual) {
    std::vector<double> out(predicted.size());
    for (size_t i = 0; i < predicted.size(); ++i) {
        out[i] = std::abs(predicted[i] - actual[i]);
    }
    return out;
}
} // namespace

namespace ErrorMetrics {
std::vector<double> flattenMatching(const Matrix& values, const Matrix& reference) {
    if (values.size() != reference.size()) {
        throw Plateau::DimensionMismatchException("row count " + std::to_string(values.size()) +
                                                  " vs " + std::to_string(reference.size()));
    }
    std::vector<double> out;
    for (size_t r = 0; r < values.size(); ++r) {
        if (values[r].size() != reference[r].size()) {
            throw Plateau::DimensionMismatchException("row " + std::to_string(r) + " has " +
                                                      std::to_string(values[r].size()) + " values, expected " +
                                                      std::to_string(reference[r].size()));
        }
        out.insert(out.end(), values[r].begin(), values[r].end());
    }
    return out;
}

double rmse(const std::vector<double>& predicted, const std::vector<double>& actual) {
    checkPair(predicted, actual, "rmse");
    double sse = 0.0;
    for (size_t i = 0; i < predicted.size(); ++i) {
        const double d = predicted[i] - actual[i];
        sse += d * d;
    }
    return std::sqrt(sse / static_cast<double>(predicted.size()));
}

double rmse(const Matrix& predicted, const Matrix& actual) {
    const auto a = flattenMatching(actual, actual);
    return rmse(flattenMatching(predicted, actual), a);
}

double meanAbsoluteError(const std::vector<double>& predicted, const std::vector<double>& actual) {
    checkPair(predicted, actual, "mean absolute error");
    const auto errors = absoluteErrors(predicted, actual);
    return std::accumulate(errors.begin(), errors.end(), 0.0) / static_cast<double>(errors.size());
}

double meanAbsoluteError(const Matrix& predicted, const Matrix& actual) {
    const auto a = flattenMatching(actual, actual);
    return meanAbsoluteError(flattenMatching(predicted, actual), a);
}

double medianAbsoluteError(const std::vector<double>& predicted, const std::vector<double>& actual) {
    checkPair(predicted, actual, "median absolute error");
    return CommonUtils::medianByNth(absoluteErrors(predicted, actual));
}

double medianAbsoluteError(const Matrix& predicted, const Matrix& actual) {
    const auto a = flattenMatching(actual, actual);
    return medianAbsoluteError(flattenMatching(predicted, actual), a);
}

double rSquared(const std::vector<double>& predicted, const std::vector<double>& actual) {
    checkPair(predicted, actual, "r-squared");
    const double mean = std::accumulate(actual.begin(), actual.end(), 0.0) / static_cast<double>(actual.size());
    double ssRes = 0.0;
    double ssTot = 0.0;
    for (size_t i = 0; i < actual.size(); ++i) {
        const double r = predicted[i] - actual[i];
        const double t = actual[i] - mean;
        ssRes += r * r;
        ssTot += t * t;
    }
    if (ssTot == 0.0) {
        if (ssRes == 0.0) return 1.0;
        throw Plateau::UndefinedMetricException("r-squared is undefined for constant actual values with nonzero residual");
    }
    return 1.0 - ssRes / ssTot;
}

double rSquared(const Matrix& predicted, const Matrix& actual) {
    const auto a = flattenMatching(actual, actual);
    return rSquared(flattenMatching(predicted, actual), a);
}

MetricSummary summarize(const Matrix& predicted, const Matrix& actual) {
    const auto a = flattenMatching(actual, actual);
    const auto p = flattenMatching(predicted, actual);

    MetricSummary out;
    out.rmse = rmse(p, a);
    out.meanAbsoluteError = meanAbsoluteError(p, a);
    out.medianAbsoluteError = medianAbsoluteError(p, a);
    try {
        out.rSquared = rSquared(p, a);
    } catch (const Plateau::UndefinedMetricException&) {
        out.rSquared.reset();
    }
    return out;
}
} // namespace ErrorMetrics
