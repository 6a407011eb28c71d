#pragma once
#include "ConvergenceController.h"
#include "Dataset.h"
#include "Predictor.h"
#include <functional>
#include <string>
#include <vector>

// Trains a model on the given input columns and returns its validation RMSE (lower is better).
using EvaluationFunction = std::function<double(const std::vector<std::string>& inputColumns)>;

struct FeatureSelectionOptions {
    size_t targetCount = 1;
    // Scores closer than this are a tie; the earlier candidate wins.
    double tieTolerance = 1e-12;
    // Only honoured in USE_OPENMP builds. The evaluation function must then be thread-safe.
    bool parallelCandidates = false;
    bool verbose = false;
    // Polled between rounds; returning true stops with the columns retained so far.
    std::function<bool()> shouldAbort;

    void validate() const;
};

struct CandidateScore {
    std::string column;
    double rmse = 0.0;
};

struct SelectionRound {
    size_t round = 0;
    std::vector<CandidateScore> scores;
    std::string committed;
    double rmse = 0.0;
};

struct FeatureSelectionResult {
    // In commit order: earlier columns added more marginal value.
    std::vector<std::string> retained;
    std::vector<SelectionRound> rounds;
    bool complete = false;
};

/**
 * @brief Greedy forward selection over input columns.
 *
 * Each round evaluates retained + {c} for every remaining candidate c and commits the one with
 * the lowest RMSE, until targetCount columns are retained. This is a greedy approximation and
 * does not guarantee the globally best subset.
 */
class FeatureSelector {
public:
    /**
     * @param candidates Column names in canonical order; this order decides ties.
     * @throws Plateau::ConfigurationException on duplicate/empty names or a missing evaluation function.
     */
    FeatureSelector(std::vector<std::string> candidates, EvaluationFunction evaluate);

    /**
     * @throws Plateau::InsufficientFeaturesException when targetCount exceeds the candidate count.
     */
    FeatureSelectionResult select(const FeatureSelectionOptions& options) const;

    const std::vector<std::string>& candidates() const noexcept { return candidates_; }

    /**
     * @brief Standard evaluation: a fresh predictor per call, trained on `learn` restricted to the
     *        requested columns under a ConvergenceController, scored on `validation`.
     * @pre learn and validation are normalized and share a schema.
     */
    static EvaluationFunction makeValidationEvaluator(const Dataset& learn,
                                                      const Dataset& validation,
                                                      PredictorFactory factory,
                                                      const ConvergenceSettings& settings);

private:
    std::vector<std::string> candidates_;
    EvaluationFunction evaluate_;
};
