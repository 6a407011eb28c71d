#include "ConvergenceController.h"
#include "PlateauExceptions.h"

#include <cmath>
#include <sstream>
#include <string>

const char* convergenceStateName(ConvergenceState state) noexcept {
    switch (state) {
        case ConvergenceState::RUNNING: return "running";
        case ConvergenceState::CONVERGED: return "converged";
        case ConvergenceState::MAX_EPOCHS_REACHED: return "max_epochs_reached";
    }
    return "unknown";
}

void ConvergenceSettings::validate() const {
    if (memory == 0) {
        throw Plateau::ConfigurationException("convergence memory must be >= 1");
    }
    if (maxEpochs == 0) {
        throw Plateau::ConfigurationException("max_epochs must be >= 1");
    }
    if (!std::isfinite(stopThreshold) || stopThreshold < 0.0) {
        std::ostringstream msg;
        msg << "stop_threshold must be a finite value >= 0, got " << stopThreshold;
        throw Plateau::ConfigurationException(msg.str());
    }
}

ConvergenceController::ConvergenceController(const ConvergenceSettings& settings) : settings_(settings) {
    settings_.validate();
    window_.assign(settings_.memory + 1, 0.0);
}

ConvergenceState ConvergenceController::step(double validationError) {
    if (isTerminal()) {
        throw Plateau::TrainingException(std::string("step() called after terminal state '") +
                                         convergenceStateName(state_) + "'");
    }

    series_.push_back(validationError);
    window_[windowHead_] = validationError;
    windowHead_ = (windowHead_ + 1) % window_.size();
    if (windowFill_ < window_.size()) ++windowFill_;

    if (windowFill_ == window_.size()) {
        lastMdrmse_ = windowMdrmse();
        if (*lastMdrmse_ < settings_.stopThreshold) {
            state_ = ConvergenceState::CONVERGED;
            return state_;
        }
    }

    if (series_.size() >= settings_.maxEpochs) {
        state_ = ConvergenceState::MAX_EPOCHS_REACHED;
    }
    return state_;
}

double ConvergenceController::windowMdrmse() const {
    // windowHead_ points at the oldest entry once the buffer is full.
    const size_t n = window_.size();
    double sum = 0.0;
    for (size_t k = 1; k < n; ++k) {
        const double prev = window_[(windowHead_ + k - 1) % n];
        const double cur = window_[(windowHead_ + k) % n];
        sum += std::abs(cur - prev);
    }
    return sum / static_cast<double>(n - 1);
}

void ConvergenceController::reset() {
    state_ = ConvergenceState::RUNNING;
    series_.clear();
    window_.assign(settings_.memory + 1, 0.0);
    windowHead_ = 0;
    windowFill_ = 0;
    lastMdrmse_.reset();
}
