#pragma once
#include "ConvergenceController.h"
#include "Dataset.h"
#include "DatasetPartitioner.h"
#include "ErrorMetrics.h"
#include "Normalizer.h"
#include "Predictor.h"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

struct TrainingRunConfig {
    enum class PartitionMode { RANDOM, EXPLICIT };

    PartitionMode partitionMode = PartitionMode::RANDOM;
    SplitRatio split;
    uint32_t seed = 0;
    // EXPLICIT mode: one raw label per row (L/V/T). When empty, labels attached to the dataset are used.
    std::vector<std::string> explicitLabels;

    // Inputs fed to the predictor, in order. Empty means every input column.
    std::vector<std::string> inputColumns;

    ConvergenceSettings convergence;
    NormalizerOptions normalizer;
    bool verbose = false;

    // Polled between epochs; returning true ends the run early with a partial result.
    std::function<bool()> shouldAbort;

    /**
     * @throws Plateau::InvalidSplitRatioException / Plateau::ConfigurationException on invalid values.
     */
    void validate() const;
};

struct FitResult {
    std::vector<double> errorSeries;
    ConvergenceState terminalState = ConvergenceState::RUNNING;
    size_t epochs = 0;
    bool aborted = false;
    std::optional<double> finalMdrmse;
};

struct TrainingResult {
    Predictor predictor;
    FitResult fit;
    std::vector<std::string> inputColumns;
    NormalizationParameters normalization;
    std::vector<PartitionLabel> labels;
    PartitionCounts counts;
    // Computed on denormalized outputs; empty for an empty subset.
    std::optional<MetricSummary> learnMetrics;
    std::optional<MetricSummary> validationMetrics;
    std::optional<MetricSummary> testMetrics;
};

class TrainingOrchestrator {
public:
    /**
     * @brief Epoch loop on already prepared subsets: train one epoch on learn, score RMSE on validation,
     *        feed the controller, repeat until it reaches a terminal state.
     * @pre learn and validation share the same schema; both are already normalized.
     * @throws Plateau::EmptyInputException when learn or validation has no rows.
     * @throws Plateau::TrainingException when the predictor is incomplete or returns a wrongly shaped batch.
     */
    static FitResult fit(const Dataset& learn,
                         const Dataset& validation,
                         Predictor& predictor,
                         const ConvergenceSettings& settings,
                         bool verbose = false,
                         const std::function<bool()>& shouldAbort = {});

    /**
     * @brief Full run: partition, normalize with learn-only parameters, fit, report metrics.
     * @details The dataset is never modified; the predictor is trained in place.
     */
    static TrainingResult run(const Dataset& data, Predictor& predictor, const TrainingRunConfig& config);
};
