#include "DatasetPartitioner.h"
#include "CommonUtils.h"
#include "PlateauExceptions.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>
#include <sstream>
#include <unordered_set>

namespace {
constexpr double kRatioSumTolerance = 1e-6;
// Absorbs representation error such as 100 * 0.7 == 69.99999...
constexpr double kCountEpsilon = 1e-9;

size_t flooredCount(size_t n, double fraction) {
    return static_cast<size_t>(std::floor(static_cast<double>(n) * fraction + kCountEpsilon));
}
} // namespace

void SplitRatio::validate() const {
    const double parts[3] = {learn, validation, test};
    const char* names[3] = {"learn", "validation", "test"};
    for (int i = 0; i < 3; ++i) {
        if (!std::isfinite(parts[i]) || parts[i] < 0.0 || parts[i] > 1.0) {
            std::ostringstream msg;
            msg << names[i] << " fraction must be in [0,1], got " << parts[i];
            throw Plateau::InvalidSplitRatioException(msg.str());
        }
    }
    const double sum = learn + validation + test;
    if (std::abs(sum - 1.0) > kRatioSumTolerance) {
        std::ostringstream msg;
        msg << "fractions must sum to 1, got " << learn << " + " << validation << " + " << test << " = " << sum;
        throw Plateau::InvalidSplitRatioException(msg.str());
    }
}

PartitionCounts DatasetPartitioner::countsFor(size_t rowCount, const SplitRatio& ratio) {
    ratio.validate();
    PartitionCounts counts;
    counts.learn = std::min(rowCount, flooredCount(rowCount, ratio.learn));
    counts.validation = std::min(rowCount - counts.learn, flooredCount(rowCount, ratio.validation));
    counts.test = rowCount - counts.learn - counts.validation;
    return counts;
}

std::vector<PartitionLabel> DatasetPartitioner::randomLabels(size_t rowCount, const SplitRatio& ratio, uint32_t seed) {
    const PartitionCounts counts = countsFor(rowCount, ratio);

    std::vector<size_t> order(rowCount);
    std::iota(order.begin(), order.end(), 0);
    std::mt19937 rng(seed);
    std::shuffle(order.begin(), order.end(), rng);

    std::vector<PartitionLabel> labels(rowCount, PartitionLabel::TEST);
    for (size_t i = 0; i < counts.learn; ++i) labels[order[i]] = PartitionLabel::LEARN;
    for (size_t i = counts.learn; i < counts.learn + counts.validation; ++i) labels[order[i]] = PartitionLabel::VALIDATION;
    return labels;
}

PartitionLabel DatasetPartitioner::parseLabel(const std::string& raw) {
    const std::string key = CommonUtils::toUpper(CommonUtils::trim(raw));
    if (key == "L" || key == "LEARN") return PartitionLabel::LEARN;
    if (key == "V" || key == "VALID" || key == "VALIDATION") return PartitionLabel::VALIDATION;
    if (key == "T" || key == "TEST") return PartitionLabel::TEST;
    throw Plateau::InvalidLabelException("'" + raw + "' is not one of L, V, T");
}

std::vector<PartitionLabel> DatasetPartitioner::explicitLabels(const std::vector<std::string>& raw) {
    std::vector<PartitionLabel> labels;
    labels.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        try {
            labels.push_back(parseLabel(raw[i]));
        } catch (const Plateau::InvalidLabelException&) {
            throw Plateau::InvalidLabelException("row " + std::to_string(i) + " has unrecognized label '" + raw[i] + "'");
        }
    }
    return labels;
}

PartitionCounts DatasetPartitioner::countLabels(const std::vector<PartitionLabel>& labels) {
    PartitionCounts counts;
    for (PartitionLabel l : labels) {
        switch (l) {
            case PartitionLabel::LEARN: ++counts.learn; break;
            case PartitionLabel::VALIDATION: ++counts.validation; break;
            case PartitionLabel::TEST: ++counts.test; break;
        }
    }
    return counts;
}

PartitionedDataset DatasetPartitioner::apply(const Dataset& data, const std::vector<PartitionLabel>& labels) {
    if (labels.size() != data.rowCount()) {
        throw Plateau::DatasetException("got " + std::to_string(labels.size()) + " partition labels for " +
                                        std::to_string(data.rowCount()) + " rows");
    }

    std::vector<size_t> learnRows;
    std::vector<size_t> validRows;
    std::vector<size_t> testRows;
    for (size_t i = 0; i < labels.size(); ++i) {
        switch (labels[i]) {
            case PartitionLabel::LEARN: learnRows.push_back(i); break;
            case PartitionLabel::VALIDATION: validRows.push_back(i); break;
            case PartitionLabel::TEST: testRows.push_back(i); break;
        }
    }

    PartitionedDataset out{data.subset(learnRows), data.subset(validRows), data.subset(testRows)};

    std::unordered_set<std::string> seen;
    seen.reserve(data.rowCount());
    for (const Dataset* part : {&out.learn, &out.validation, &out.test}) {
        for (const auto& id : part->rowIds()) {
            if (!seen.insert(id).second) {
                throw Plateau::DatasetException("row '" + id + "' was assigned to more than one partition");
            }
        }
    }
    if (seen.size() != data.rowCount()) {
        throw Plateau::DatasetException("partitions cover " + std::to_string(seen.size()) + " of " +
                                        std::to_string(data.rowCount()) + " rows");
    }
    return out;
}

PartitionedDataset DatasetPartitioner::apply(const Dataset& data) {
    if (!data.hasLabels() && !data.empty()) {
        throw Plateau::DatasetException("dataset has no partition labels attached");
    }
    return apply(data, data.labels());
}
