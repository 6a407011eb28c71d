#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

/**
 * @brief Capability handle for any trainable numeric model.
 *
 * The core only needs two operations: fit one epoch on the learn rows and predict a batch.
 * Any type exposing `trainOneEpoch(inputs, outputs)` and `predict(inputs)` can be wrapped with
 * makePredictor() without deriving from anything. Implementations must be deterministic for
 * identical internal state and inputs so error series are reproducible.
 */
struct Predictor {
    using Matrix = std::vector<std::vector<double>>;

    std::function<void(const Matrix& inputs, const Matrix& outputs)> trainOneEpoch;
    std::function<Matrix(const Matrix& inputs)> predict;

    bool valid() const noexcept { return static_cast<bool>(trainOneEpoch) && static_cast<bool>(predict); }
};

// Builds a fresh, untrained predictor for the given input/output widths.
using PredictorFactory = std::function<Predictor(size_t inputCount, size_t outputCount)>;

/**
 * @brief Wraps a shared model object; the handle keeps the model alive.
 */
template <typename Model>
Predictor makePredictor(std::shared_ptr<Model> model) {
    Predictor p;
    p.trainOneEpoch = [model](const Predictor::Matrix& inputs, const Predictor::Matrix& outputs) {
        model->trainOneEpoch(inputs, outputs);
    };
    p.predict = [model](const Predictor::Matrix& inputs) -> Predictor::Matrix {
        return model->predict(inputs);
    };
    return p;
}

template <typename Model, typename... Args>
Predictor makePredictor(Args&&... args) {
    return makePredictor(std::make_shared<Model>(std::forward<Args>(args)...));
}
