#pragma once
#include "Dataset.h"
#include <cstdint>
#include <string>
#include <vector>

struct SplitRatio {
    double learn = 0.7;
    double validation = 0.2;
    double test = 0.1;

    /**
     * @brief Each fraction must lie in [0,1] and the three must sum to 1 within 1e-6.
     * @throws Plateau::InvalidSplitRatioException otherwise.
     */
    void validate() const;
};

struct PartitionCounts {
    size_t learn = 0;
    size_t validation = 0;
    size_t test = 0;
};

struct PartitionedDataset {
    Dataset learn;
    Dataset validation;
    Dataset test;
};

class DatasetPartitioner {
public:
    /**
     * @brief Row counts for a random split: learn and validation are floored, test takes the remainder.
     */
    static PartitionCounts countsFor(size_t rowCount, const SplitRatio& ratio);

    /**
     * @brief Reproducible random assignment: a seeded permutation of row indices,
     *        the first countsFor().learn rows are LEARN, the next validation rows VALIDATION, the rest TEST.
     * @post Same seed and rowCount always produce the same labels.
     * @throws Plateau::InvalidSplitRatioException on an invalid ratio.
     */
    static std::vector<PartitionLabel> randomLabels(size_t rowCount, const SplitRatio& ratio, uint32_t seed);

    /**
     * @brief Parses one pre-assigned label. Accepts L/V/T and learn/validation/valid/test, case-insensitive.
     * @throws Plateau::InvalidLabelException on anything else.
     */
    static PartitionLabel parseLabel(const std::string& raw);

    /**
     * @brief Validates and converts a pre-assigned label column.
     * @throws Plateau::InvalidLabelException naming the first offending row.
     */
    static std::vector<PartitionLabel> explicitLabels(const std::vector<std::string>& raw);

    static PartitionCounts countLabels(const std::vector<PartitionLabel>& labels);

    /**
     * @brief Splits rows into three disjoint subsets, preserving the original row order within each.
     * @throws Plateau::DatasetException when labels.size() != data.rowCount() or a row id lands in two subsets.
     */
    static PartitionedDataset apply(const Dataset& data, const std::vector<PartitionLabel>& labels);

    /**
     * @brief Splits by the labels already attached to `data`.
     * @throws Plateau::DatasetException when no labels are attached to a non-empty dataset.
     */
    static PartitionedDataset apply(const Dataset& data);
};
