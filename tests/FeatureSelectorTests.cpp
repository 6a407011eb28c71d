#include <catch2/catch.hpp>

#include "FeatureSelector.h"
#include "PlateauExceptions.h"
#include "TestPredictors.h"

#include <cmath>
#include <map>
#include <stdexcept>

namespace {
// Score falls as the summed weight of the chosen columns grows.
EvaluationFunction weightedEvaluator(std::map<std::string, double> weights) {
    return [weights](const std::vector<std::string>& cols) {
        double total = 0.0;
        for (const auto& c : cols) total += weights.at(c);
        return 1.0 / (1.0 + total);
    };
}

FeatureSelectionOptions optionsFor(size_t k) {
    FeatureSelectionOptions o;
    o.targetCount = k;
    return o;
}
} // namespace

TEST_CASE("greedy selection commits the best candidate each round", "[selector]") {
    const FeatureSelector selector({"a", "b", "c", "d"},
                                   weightedEvaluator({{"a", 1.0}, {"b", 3.0}, {"c", 2.0}, {"d", 0.0}}));

    SECTION("single column") {
        const auto result = selector.select(optionsFor(1));
        REQUIRE(result.complete);
        REQUIRE(result.retained == std::vector<std::string>{"b"});
    }
    SECTION("every column, in order of marginal value") {
        const auto result = selector.select(optionsFor(4));
        REQUIRE(result.retained == std::vector<std::string>{"b", "c", "a", "d"});
        REQUIRE(result.rounds.size() == 4);
        REQUIRE(result.rounds[0].scores.size() == 4);
        REQUIRE(result.rounds[3].scores.size() == 1);
        REQUIRE(result.rounds[1].committed == "c");
        REQUIRE(result.rounds[1].rmse == Approx(1.0 / 6.0));
    }
}

TEST_CASE("ties go to the earlier candidate", "[selector]") {
    const FeatureSelector selector({"a", "b", "c"}, weightedEvaluator({{"a", 1.0}, {"b", 2.0}, {"c", 2.0}}));
    for (int run = 0; run < 5; ++run) {
        REQUIRE(selector.select(optionsFor(1)).retained == std::vector<std::string>{"b"});
    }

    // Within tolerance counts as a tie as well.
    const FeatureSelector close({"x", "y"}, [](const std::vector<std::string>& cols) {
        return cols.back() == "x" ? 0.5 : 0.5 - 1e-9;
    });
    FeatureSelectionOptions loose = optionsFor(1);
    loose.tieTolerance = 1e-6;
    REQUIRE(close.select(loose).retained == std::vector<std::string>{"x"});
    REQUIRE(close.select(optionsFor(1)).retained == std::vector<std::string>{"y"});
}

TEST_CASE("NaN scores rank last", "[selector]") {
    const FeatureSelector selector({"nan", "ok"}, [](const std::vector<std::string>& cols) {
        return cols.back() == "nan" ? std::nan("") : 0.9;
    });
    REQUIRE(selector.select(optionsFor(1)).retained == std::vector<std::string>{"ok"});
}

TEST_CASE("each trial is the retained set plus one candidate", "[selector]") {
    std::vector<std::vector<std::string>> calls;
    const FeatureSelector selector({"a", "b", "c"}, [&calls](const std::vector<std::string>& cols) {
        calls.push_back(cols);
        return cols.back() == "c" ? 0.1 : 0.5;
    });
    const auto result = selector.select(optionsFor(2));
    REQUIRE(result.retained == std::vector<std::string>{"c", "a"});
    REQUIRE(calls.size() == 5);
    REQUIRE(calls[0] == std::vector<std::string>{"a"});
    REQUIRE(calls[2] == std::vector<std::string>{"c"});
    REQUIRE(calls[3] == std::vector<std::string>{"c", "a"});
    REQUIRE(calls[4] == std::vector<std::string>{"c", "b"});
}

TEST_CASE("invalid requests are rejected", "[selector]") {
    const FeatureSelector selector({"a", "b"}, weightedEvaluator({{"a", 1.0}, {"b", 2.0}}));
    REQUIRE_THROWS_AS(selector.select(optionsFor(3)), Plateau::InsufficientFeaturesException);
    REQUIRE_THROWS_AS(selector.select(optionsFor(0)), Plateau::ConfigurationException);

    REQUIRE_THROWS_AS(FeatureSelector({"a", "a"}, weightedEvaluator({{"a", 1.0}})), Plateau::ConfigurationException);
    REQUIRE_THROWS_AS(FeatureSelector({"a"}, EvaluationFunction()), Plateau::ConfigurationException);
}

TEST_CASE("evaluation failures propagate", "[selector]") {
    const FeatureSelector selector({"a", "b"}, [](const std::vector<std::string>& cols) -> double {
        if (cols.back() == "b") throw std::runtime_error("model blew up");
        return 0.5;
    });
    REQUIRE_THROWS_WITH(selector.select(optionsFor(1)), Catch::Contains("model blew up"));
}

TEST_CASE("abort between rounds returns a partial result", "[selector]") {
    const FeatureSelector selector({"a", "b", "c"}, weightedEvaluator({{"a", 1.0}, {"b", 2.0}, {"c", 3.0}}));
    int polls = 0;
    FeatureSelectionOptions options = optionsFor(3);
    options.shouldAbort = [&polls]() { return ++polls > 1; };

    const auto result = selector.select(options);
    REQUIRE_FALSE(result.complete);
    REQUIRE(result.retained == std::vector<std::string>{"c"});
    REQUIRE(result.rounds.size() == 1);
}

TEST_CASE("parallel candidate evaluation gives the same result", "[selector]") {
    const FeatureSelector selector({"a", "b", "c", "d", "e"},
                                   weightedEvaluator({{"a", 0.3}, {"b", 4.0}, {"c", 2.0}, {"d", 2.0}, {"e", 1.0}}));
    FeatureSelectionOptions serial = optionsFor(4);
    FeatureSelectionOptions parallel = optionsFor(4);
    parallel.parallelCandidates = true;
    REQUIRE(selector.select(serial).retained == selector.select(parallel).retained);
}

TEST_CASE("validation evaluator picks the informative column", "[selector]") {
    Dataset learn({"signal", "noise"}, {"y"});
    Dataset validation({"signal", "noise"}, {"y"});
    uint32_t state = 11;
    for (size_t i = 0; i < 40; ++i) {
        const double x = TestPredictors::lcgUniform(state);
        const double n = TestPredictors::lcgUniform(state);
        Dataset& target = i < 30 ? learn : validation;
        target.addRow("r" + std::to_string(i), {x, n}, {2.0 * x});
    }

    ConvergenceSettings settings;
    settings.memory = 2;
    settings.stopThreshold = 1e-9;
    settings.maxEpochs = 20;
    PredictorFactory factory = [](size_t inputs, size_t outputs) {
        return makePredictor<TestPredictors::LeastSquaresPredictor>(inputs, outputs);
    };

    const EvaluationFunction evaluate = FeatureSelector::makeValidationEvaluator(learn, validation, factory, settings);
    REQUIRE(evaluate({"signal"}) < 1e-6);
    REQUIRE(evaluate({"noise"}) > 0.1);

    const FeatureSelector selector({"noise", "signal"}, evaluate);
    REQUIRE(selector.select(optionsFor(1)).retained == std::vector<std::string>{"signal"});

    REQUIRE_THROWS_AS(FeatureSelector::makeValidationEvaluator(learn, validation, PredictorFactory(), settings),
                      Plateau::ConfigurationException);
}
