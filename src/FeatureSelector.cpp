#include "FeatureSelector.h"
#include "PlateauExceptions.h"
#include "TrainingOrchestrator.h"

#include <cmath>
#include <exception>
#include <iostream>
#include <limits>
#include <memory>
#include <cstddef>
#include <unordered_set>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
std::vector<double> evaluateRound(const EvaluationFunction& evaluate,
                                  const std::vector<std::string>& retained,
                                  const std::vector<std::string>& remaining,
                                  bool parallel) {
    const size_t n = remaining.size();
    std::vector<double> scores(n, std::numeric_limits<double>::infinity());
    std::vector<std::exception_ptr> errors(n);

    auto evalOne = [&](size_t i) {
        std::vector<std::string> trial = retained;
        trial.push_back(remaining[i]);
        try {
            scores[i] = evaluate(trial);
        } catch (...) {
            errors[i] = std::current_exception();
        }
    };

    #ifdef USE_OPENMP
    if (parallel) {
        #pragma omp parallel for schedule(dynamic)
        for (long long i = 0; i < static_cast<long long>(n); ++i) {
            evalOne(static_cast<size_t>(i));
        }
    } else {
        for (size_t i = 0; i < n; ++i) evalOne(i);
    }
    #else
    (void)parallel;
    for (size_t i = 0; i < n; ++i) evalOne(i);
    #endif

    // Barrier passed: surface the first failure in candidate order.
    for (const auto& err : errors) {
        if (err) std::rethrow_exception(err);
    }
    return scores;
}
} // namespace

void FeatureSelectionOptions::validate() const {
    if (targetCount == 0) {
        throw Plateau::ConfigurationException("feature selection target count must be >= 1");
    }
    if (!std::isfinite(tieTolerance) || tieTolerance < 0.0) {
        throw Plateau::ConfigurationException("tie tolerance must be a finite value >= 0");
    }
}

FeatureSelector::FeatureSelector(std::vector<std::string> candidates, EvaluationFunction evaluate)
    : candidates_(std::move(candidates)), evaluate_(std::move(evaluate)) {
    if (!evaluate_) {
        throw Plateau::ConfigurationException("feature selector requires an evaluation function");
    }
    std::unordered_set<std::string> seen;
    for (const auto& c : candidates_) {
        if (c.empty()) throw Plateau::ConfigurationException("empty candidate column name");
        if (!seen.insert(c).second) throw Plateau::ConfigurationException("duplicate candidate column: " + c);
    }
}

FeatureSelectionResult FeatureSelector::select(const FeatureSelectionOptions& options) const {
    if (options.targetCount > candidates_.size()) {
        throw Plateau::InsufficientFeaturesException("requested " + std::to_string(options.targetCount) +
                                                     " columns but only " + std::to_string(candidates_.size()) +
                                                     " are available");
    }
    options.validate();

    FeatureSelectionResult result;
    std::vector<std::string> remaining = candidates_;

    while (result.retained.size() < options.targetCount && !remaining.empty()) {
        if (options.shouldAbort && options.shouldAbort()) {
            if (options.verbose) {
                std::cout << "[Plateau][Selector] Aborted by caller with " << result.retained.size()
                          << " columns retained\n";
            }
            return result;
        }

        const std::vector<double> scores = evaluateRound(evaluate_, result.retained, remaining, options.parallelCandidates);

        SelectionRound round;
        round.round = result.rounds.size() + 1;
        round.scores.reserve(remaining.size());

        size_t best = 0;
        double bestScore = std::numeric_limits<double>::infinity();
        bool haveBest = false;
        for (size_t i = 0; i < remaining.size(); ++i) {
            double s = scores[i];
            if (std::isnan(s)) {
                if (options.verbose) {
                    std::cout << "[Plateau][Warning] Candidate '" << remaining[i] << "' produced NaN RMSE, ranking it last\n";
                }
                s = std::numeric_limits<double>::infinity();
            }
            round.scores.push_back({remaining[i], s});
            // Strictly better beyond tolerance; otherwise keep the earlier candidate.
            if (!haveBest || s < bestScore - options.tieTolerance) {
                best = i;
                bestScore = s;
                haveBest = true;
            }
        }

        round.committed = remaining[best];
        round.rmse = bestScore;
        result.retained.push_back(remaining[best]);
        remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(best));

        if (options.verbose) {
            std::cout << "[Plateau][Selector] Round " << round.round << ": committed '" << round.committed
                      << "' (rmse=" << round.rmse << ", " << round.scores.size() << " candidates)\n";
        }
        result.rounds.push_back(std::move(round));
    }

    result.complete = true;
    return result;
}

EvaluationFunction FeatureSelector::makeValidationEvaluator(const Dataset& learn,
                                                            const Dataset& validation,
                                                            PredictorFactory factory,
                                                            const ConvergenceSettings& settings) {
    if (!factory) {
        throw Plateau::ConfigurationException("validation evaluator requires a predictor factory");
    }
    settings.validate();

    auto learnCopy = std::make_shared<const Dataset>(learn);
    auto validationCopy = std::make_shared<const Dataset>(validation);
    return [learnCopy, validationCopy, factory, settings](const std::vector<std::string>& columns) {
        const Dataset learnSub = learnCopy->withInputs(columns);
        const Dataset validSub = validationCopy->withInputs(columns);
        Predictor predictor = factory(columns.size(), learnSub.outputCount());
        const FitResult fit = TrainingOrchestrator::fit(learnSub, validSub, predictor, settings);
        if (fit.errorSeries.empty()) {
            throw Plateau::TrainingException("evaluation finished without a single epoch");
        }
        return fit.errorSeries.back();
    };
}
