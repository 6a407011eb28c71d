#pragma once
#include "Dataset.h"
#include <string>
#include <vector>

struct ColumnRange {
    std::string column;
    double min = 0.0;
    double max = 1.0;

    bool isDegenerate() const noexcept { return max == min; }
};

// Plain value: callers may serialize it however they like.
struct NormalizationParameters {
    std::vector<ColumnRange> ranges;

    /**
     * @throws Plateau::DatasetException when the column has no range.
     */
    const ColumnRange& range(const std::string& column) const;
    bool contains(const std::string& column) const;
};

struct NormalizerOptions {
    // Clamp input values that fall outside the fitted range (e.g. validation rows) into [0,1].
    // normalize() never clamps output columns.
    bool clampToUnit = false;
};

class Normalizer {
public:
    using Matrix = Dataset::Matrix;

    /**
     * @brief Min/max per column over every row of `data`.
     * @pre Each name is an input or output column of `data`.
     * @throws Plateau::EmptyInputException when `data` has no rows.
     * @throws Plateau::DatasetException on unknown or non-finite columns.
     */
    static NormalizationParameters computeParameters(const Dataset& data, const std::vector<std::string>& columns);

    /**
     * @brief Rescales each parameterized column to (v - min) / (max - min).
     * @details Degenerate columns (max == min) map to 0.5. Columns without parameters pass through.
     */
    static Dataset normalize(const Dataset& data, const NormalizationParameters& params,
                             const NormalizerOptions& options = {});

    static double normalizeValue(double value, const ColumnRange& range, const NormalizerOptions& options = {});

    /**
     * @brief Inverse of normalizeValue; degenerate columns return min.
     */
    static double denormalize(double value, const NormalizationParameters& params, const std::string& column);

    /**
     * @brief Inverts a row-major matrix whose j-th column corresponds to columns[j].
     * @throws Plateau::DimensionMismatchException when a row width differs from columns.size().
     */
    static Matrix denormalizeMatrix(const Matrix& values, const NormalizationParameters& params,
                                    const std::vector<std::string>& columns);
};
