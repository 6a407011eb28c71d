#include "Normalizer.h"
#include "PlateauExceptions.h"

#include <algorithm>
#include <cmath>

const ColumnRange& NormalizationParameters::range(const std::string& column) const {
    for (const auto& r : ranges) {
        if (r.column == column) return r;
    }
    throw Plateau::DatasetException("no normalization parameters for column: " + column);
}

bool NormalizationParameters::contains(const std::string& column) const {
    return std::any_of(ranges.begin(), ranges.end(), [&](const ColumnRange& r) { return r.column == column; });
}

NormalizationParameters Normalizer::computeParameters(const Dataset& data, const std::vector<std::string>& columns) {
    if (data.empty()) {
        throw Plateau::EmptyInputException("cannot compute normalization parameters from zero rows");
    }

    NormalizationParameters params;
    params.ranges.reserve(columns.size());
    for (const auto& name : columns) {
        if (params.contains(name)) {
            throw Plateau::DatasetException("column listed twice for normalization: " + name);
        }
        const auto& values = data.numericColumn(name);
        auto mm = std::minmax_element(values.begin(), values.end());
        if (!std::isfinite(*mm.first) || !std::isfinite(*mm.second)) {
            throw Plateau::DatasetException("non-finite value in column: " + name);
        }
        params.ranges.push_back({name, *mm.first, *mm.second});
    }
    return params;
}

double Normalizer::normalizeValue(double value, const ColumnRange& range, const NormalizerOptions& options) {
    if (range.isDegenerate()) return 0.5;
    const double scaled = (value - range.min) / (range.max - range.min);
    return options.clampToUnit ? std::clamp(scaled, 0.0, 1.0) : scaled;
}

Dataset Normalizer::normalize(const Dataset& data, const NormalizationParameters& params, const NormalizerOptions& options) {
    for (const auto& r : params.ranges) {
        if (data.findInputIndex(r.column) < 0 && data.findOutputIndex(r.column) < 0) {
            throw Plateau::DatasetException("normalization column not present in dataset: " + r.column);
        }
    }
    // Outputs are never clamped so they stay invertible.
    NormalizerOptions outputOptions = options;
    outputOptions.clampToUnit = false;
    return data.transformed([&](const std::string& column, double value) {
        const NormalizerOptions& opts = data.findInputIndex(column) >= 0 ? options : outputOptions;
        for (const auto& r : params.ranges) {
            if (r.column == column) return normalizeValue(value, r, opts);
        }
        return value;
    });
}

double Normalizer::denormalize(double value, const NormalizationParameters& params, const std::string& column) {
    const ColumnRange& r = params.range(column);
    if (r.isDegenerate()) return r.min;
    return value * (r.max - r.min) + r.min;
}

Normalizer::Matrix Normalizer::denormalizeMatrix(const Matrix& values, const NormalizationParameters& params,
                                                 const std::vector<std::string>& columns) {
    std::vector<const ColumnRange*> ranges;
    ranges.reserve(columns.size());
    for (const auto& c : columns) ranges.push_back(&params.range(c));

    Matrix out = values;
    for (size_t i = 0; i < out.size(); ++i) {
        if (out[i].size() != columns.size()) {
            throw Plateau::DimensionMismatchException("row " + std::to_string(i) + " has " + std::to_string(out[i].size()) +
                                                      " values, expected " + std::to_string(columns.size()));
        }
        for (size_t j = 0; j < columns.size(); ++j) {
            const ColumnRange& r = *ranges[j];
            out[i][j] = r.isDegenerate() ? r.min : out[i][j] * (r.max - r.min) + r.min;
        }
    }
    return out;
}
