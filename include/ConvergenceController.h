#pragma once
#include <cstddef>
#include <optional>
#include <vector>

enum class ConvergenceState { RUNNING, CONVERGED, MAX_EPOCHS_REACHED };

const char* convergenceStateName(ConvergenceState state) noexcept;

struct ConvergenceSettings {
    // Number of epoch-to-epoch deltas averaged into mdrmse.
    size_t memory = 250;
    // Converged once mdrmse drops below this.
    double stopThreshold = 1e-4;
    size_t maxEpochs = 10000;

    /**
     * @throws Plateau::ConfigurationException when memory or maxEpochs is zero, or stopThreshold is negative/non-finite.
     */
    void validate() const;
};

/**
 * @brief Decides after every epoch whether training should continue.
 *
 * Keeps the last memory+1 validation errors in a ring buffer and compares the mean absolute
 * epoch-to-epoch change (mdrmse) against stopThreshold. Stays RUNNING until the window is full,
 * then moves to CONVERGED once mdrmse < stopThreshold, or to MAX_EPOCHS_REACHED when the epoch
 * budget is spent. CONVERGED wins when both happen on the same epoch.
 */
class ConvergenceController {
public:
    explicit ConvergenceController(const ConvergenceSettings& settings);

    /**
     * @brief Records the validation error of the epoch that just finished.
     * @throws Plateau::TrainingException when called after a terminal state.
     */
    ConvergenceState step(double validationError);

    ConvergenceState state() const noexcept { return state_; }
    bool isTerminal() const noexcept { return state_ != ConvergenceState::RUNNING; }
    size_t epochCount() const noexcept { return series_.size(); }
    const std::vector<double>& errorSeries() const noexcept { return series_; }
    const ConvergenceSettings& settings() const noexcept { return settings_; }

    // Empty until the window holds memory+1 errors.
    std::optional<double> lastMdrmse() const noexcept { return lastMdrmse_; }

    void reset();

private:
    double windowMdrmse() const;

    ConvergenceSettings settings_;
    ConvergenceState state_ = ConvergenceState::RUNNING;
    std::vector<double> series_;
    std::vector<double> window_;
    size_t windowHead_ = 0;
    size_t windowFill_ = 0;
    std::optional<double> lastMdrmse_;
};
