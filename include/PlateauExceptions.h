#ifndef PLATEAU_EXCEPTIONS_H
#define PLATEAU_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Plateau {

class PlateauException : public std::runtime_error {
public:
    explicit PlateauException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public PlateauException {
public:
    explicit IOException(const std::string& message) : PlateauException("IO Error: " + message) {}
};

class DatasetException : public PlateauException {
public:
    explicit DatasetException(const std::string& message) : PlateauException("Dataset Error: " + message) {}
};

class ConfigurationException : public PlateauException {
public:
    explicit ConfigurationException(const std::string& message) : PlateauException("Configuration Error: " + message) {}
};

class TrainingException : public PlateauException {
public:
    explicit TrainingException(const std::string& message) : PlateauException("Training Error: " + message) {}
};

class DimensionMismatchException : public PlateauException {
public:
    explicit DimensionMismatchException(const std::string& message) : PlateauException("Dimension Mismatch: " + message) {}
};

class EmptyInputException : public PlateauException {
public:
    explicit EmptyInputException(const std::string& message) : PlateauException("Empty Input: " + message) {}
};

class UndefinedMetricException : public PlateauException {
public:
    explicit UndefinedMetricException(const std::string& message) : PlateauException("Undefined Metric: " + message) {}
};

class InvalidSplitRatioException : public PlateauException {
public:
    explicit InvalidSplitRatioException(const std::string& message) : PlateauException("Invalid Split Ratio: " + message) {}
};

class InvalidLabelException : public PlateauException {
public:
    explicit InvalidLabelException(const std::string& message) : PlateauException("Invalid Label: " + message) {}
};

class InsufficientFeaturesException : public PlateauException {
public:
    explicit InsufficientFeaturesException(const std::string& message) : PlateauException("Insufficient Features: " + message) {}
};

} // namespace Plateau

#endif // PLATEAU_EXCEPTIONS_H
