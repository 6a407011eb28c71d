#include "TrainingOrchestrator.h"
#include "PlateauExceptions.h"

#include <algorithm>
#include <iostream>
#include <unordered_set>

namespace {
using Matrix = Dataset::Matrix;

void checkPrediction(const Matrix& predicted, size_t rows, size_t width) {
    if (predicted.size() != rows) {
        throw Plateau::TrainingException("predictor returned " + std::to_string(predicted.size()) +
                                         " rows for a batch of " + std::to_string(rows));
    }
    for (const auto& row : predicted) {
        if (row.size() != width) {
            throw Plateau::TrainingException("predictor returned " + std::to_string(row.size()) +
                                             " outputs per row, expected " + std::to_string(width));
        }
    }
}

// `scaled` feeds the predictor; `raw` holds the same rows before normalization and supplies the targets.
std::optional<MetricSummary> scoreSubset(const Dataset& scaled,
                                         const Dataset& raw,
                                         Predictor& predictor,
                                         const NormalizationParameters& params) {
    if (scaled.empty()) return std::nullopt;
    const Matrix predicted = predictor.predict(scaled.inputMatrix());
    checkPrediction(predicted, scaled.rowCount(), scaled.outputCount());
    const Matrix p = Normalizer::denormalizeMatrix(predicted, params, scaled.outputNames());
    return ErrorMetrics::summarize(p, raw.outputMatrix());
}

void printMetrics(const char* name, const std::optional<MetricSummary>& m) {
    if (!m) return;
    std::cout << "[Plateau][Training] " << name << ": rmse=" << m->rmse
              << " mae=" << m->meanAbsoluteError
              << " medae=" << m->medianAbsoluteError
              << " r2=";
    if (m->rSquared) std::cout << *m->rSquared;
    else std::cout << "undefined";
    std::cout << "\n";
}
} // namespace

void TrainingRunConfig::validate() const {
    if (partitionMode == PartitionMode::RANDOM) split.validate();
    convergence.validate();

    std::unordered_set<std::string> seen;
    for (const auto& c : inputColumns) {
        if (!seen.insert(c).second) {
            throw Plateau::ConfigurationException("input column listed twice: " + c);
        }
    }
}

FitResult TrainingOrchestrator::fit(const Dataset& learn,
                                    const Dataset& validation,
                                    Predictor& predictor,
                                    const ConvergenceSettings& settings,
                                    bool verbose,
                                    const std::function<bool()>& shouldAbort) {
    if (!predictor.valid()) {
        throw Plateau::TrainingException("predictor must provide both trainOneEpoch and predict");
    }
    if (learn.empty()) throw Plateau::EmptyInputException("learn subset has no rows");
    if (validation.empty()) throw Plateau::EmptyInputException("validation subset has no rows");
    if (learn.inputNames() != validation.inputNames() || learn.outputNames() != validation.outputNames()) {
        throw Plateau::DatasetException("learn and validation subsets have different schemas");
    }

    ConvergenceController controller(settings);
    const Matrix learnX = learn.inputMatrix();
    const Matrix learnY = learn.outputMatrix();
    const Matrix validX = validation.inputMatrix();
    const Matrix validY = validation.outputMatrix();
    const size_t reportEvery = std::max<size_t>(1, settings.maxEpochs / 10);

    FitResult result;
    while (!controller.isTerminal()) {
        if (shouldAbort && shouldAbort()) {
            result.aborted = true;
            if (verbose) {
                std::cout << "[Plateau][Training] Aborted by caller after " << controller.epochCount() << " epochs\n";
            }
            break;
        }

        predictor.trainOneEpoch(learnX, learnY);
        const Matrix predicted = predictor.predict(validX);
        checkPrediction(predicted, validX.size(), validation.outputCount());
        const double score = ErrorMetrics::rmse(predicted, validY);
        controller.step(score);

        if (verbose && (controller.epochCount() % reportEvery == 0)) {
            std::cout << "[Plateau][Training] Epoch " << controller.epochCount() << "/" << settings.maxEpochs
                      << " validation rmse=" << score;
            if (controller.lastMdrmse()) std::cout << " mdrmse=" << *controller.lastMdrmse();
            std::cout << "\n";
        }
    }

    result.errorSeries = controller.errorSeries();
    result.terminalState = controller.state();
    result.epochs = controller.epochCount();
    result.finalMdrmse = controller.lastMdrmse();
    if (verbose && !result.aborted) {
        std::cout << "[Plateau][Training] Stopped: " << convergenceStateName(result.terminalState)
                  << " after " << result.epochs << " epochs\n";
    }
    return result;
}

TrainingResult TrainingOrchestrator::run(const Dataset& data, Predictor& predictor, const TrainingRunConfig& config) {
    config.validate();

    TrainingResult result;
    result.inputColumns = config.inputColumns.empty() ? data.inputNames() : config.inputColumns;
    const Dataset working = data.withInputs(result.inputColumns);

    if (config.partitionMode == TrainingRunConfig::PartitionMode::RANDOM) {
        result.labels = DatasetPartitioner::randomLabels(working.rowCount(), config.split, config.seed);
    } else if (!config.explicitLabels.empty()) {
        result.labels = DatasetPartitioner::explicitLabels(config.explicitLabels);
    } else if (data.hasLabels()) {
        result.labels = data.labels();
    } else {
        throw Plateau::ConfigurationException("explicit partitioning requires labels, none were given or attached");
    }
    if (result.labels.size() != working.rowCount()) {
        throw Plateau::DatasetException("got " + std::to_string(result.labels.size()) + " partition labels for " +
                                        std::to_string(working.rowCount()) + " rows");
    }
    result.counts = DatasetPartitioner::countLabels(result.labels);

    // Parameters come from learn rows only so validation/test values do not leak into scaling.
    std::vector<size_t> learnRows;
    learnRows.reserve(result.counts.learn);
    for (size_t i = 0; i < result.labels.size(); ++i) {
        if (result.labels[i] == PartitionLabel::LEARN) learnRows.push_back(i);
    }
    std::vector<std::string> scaledColumns = result.inputColumns;
    scaledColumns.insert(scaledColumns.end(), working.outputNames().begin(), working.outputNames().end());
    result.normalization = Normalizer::computeParameters(working.subset(learnRows), scaledColumns);

    const Dataset normalized = Normalizer::normalize(working, result.normalization, config.normalizer);
    PartitionedDataset parts = DatasetPartitioner::apply(normalized, result.labels);
    const PartitionedDataset rawParts = DatasetPartitioner::apply(working, result.labels);

    if (config.verbose) {
        std::cout << "[Plateau][Training] Partitioned " << working.rowCount() << " rows: learn=" << result.counts.learn
                  << " validation=" << result.counts.validation << " test=" << result.counts.test
                  << " | inputs=" << result.inputColumns.size() << "\n";
    }

    result.fit = fit(parts.learn, parts.validation, predictor, config.convergence, config.verbose, config.shouldAbort);
    result.predictor = predictor;

    result.learnMetrics = scoreSubset(parts.learn, rawParts.learn, predictor, result.normalization);
    result.validationMetrics = scoreSubset(parts.validation, rawParts.validation, predictor, result.normalization);
    result.testMetrics = scoreSubset(parts.test, rawParts.test, predictor, result.normalization);

    if (config.verbose) {
        printMetrics("learn", result.learnMetrics);
        printMetrics("validation", result.validationMetrics);
        printMetrics("test", result.testMetrics);
    }
    return result;
}
