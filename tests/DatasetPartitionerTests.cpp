#include <catch2/catch.hpp>

#include "DatasetPartitioner.h"
#include "PlateauExceptions.h"
#include "TestPredictors.h"

#include <cstdlib>
#include <set>

TEST_CASE("random split of 100 rows at 0.7/0.2/0.1 is exact and reproducible", "[partitioner]") {
    const SplitRatio ratio{0.7, 0.2, 0.1};
    const auto first = DatasetPartitioner::randomLabels(100, ratio, 42);
    const auto second = DatasetPartitioner::randomLabels(100, ratio, 42);

    const PartitionCounts counts = DatasetPartitioner::countLabels(first);
    REQUIRE(counts.learn == 70);
    REQUIRE(counts.validation == 20);
    REQUIRE(counts.test == 10);
    REQUIRE(first == second);
}

TEST_CASE("different seeds shuffle differently", "[partitioner]") {
    const SplitRatio ratio{0.5, 0.25, 0.25};
    REQUIRE(DatasetPartitioner::randomLabels(200, ratio, 1) != DatasetPartitioner::randomLabels(200, ratio, 2));
}

TEST_CASE("learn and validation counts are floored, test takes the remainder", "[partitioner]") {
    SECTION("uneven fractions") {
        const PartitionCounts c = DatasetPartitioner::countsFor(7, {0.5, 0.3, 0.2});
        REQUIRE(c.learn == 3);
        REQUIRE(c.validation == 2);
        REQUIRE(c.test == 2);
    }
    SECTION("every size stays within one row of the requested fractions") {
        const SplitRatio ratio{0.6, 0.25, 0.15};
        for (size_t n = 0; n < 60; ++n) {
            const auto labels = DatasetPartitioner::randomLabels(n, ratio, 9);
            const PartitionCounts c = DatasetPartitioner::countLabels(labels);
            REQUIRE(c.learn + c.validation + c.test == n);
            REQUIRE(std::abs(static_cast<double>(c.learn) - n * ratio.learn) <= 1.0);
            REQUIRE(std::abs(static_cast<double>(c.validation) - n * ratio.validation) <= 1.0);
            REQUIRE(std::abs(static_cast<double>(c.test) - n * ratio.test) <= 2.0);
        }
    }
}

TEST_CASE("split ratios are validated, never coerced", "[partitioner]") {
    REQUIRE_THROWS_AS(DatasetPartitioner::randomLabels(10, {0.7, 0.2, 0.2}, 1), Plateau::InvalidSplitRatioException);
    REQUIRE_THROWS_AS(DatasetPartitioner::randomLabels(10, {0.5, 0.2, 0.2}, 1), Plateau::InvalidSplitRatioException);
    REQUIRE_THROWS_AS(DatasetPartitioner::randomLabels(10, {1.2, -0.1, -0.1}, 1), Plateau::InvalidSplitRatioException);
    REQUIRE_NOTHROW(SplitRatio{1.0, 0.0, 0.0}.validate());
}

TEST_CASE("explicit labels pass through after validation", "[partitioner]") {
    const auto labels = DatasetPartitioner::explicitLabels({"L", "v", " T ", "learn", "Validation", "test"});
    REQUIRE(labels == std::vector<PartitionLabel>{PartitionLabel::LEARN, PartitionLabel::VALIDATION, PartitionLabel::TEST,
                                                  PartitionLabel::LEARN, PartitionLabel::VALIDATION, PartitionLabel::TEST});

    REQUIRE_THROWS_AS(DatasetPartitioner::explicitLabels({"L", "X"}), Plateau::InvalidLabelException);
    REQUIRE_THROWS_AS(DatasetPartitioner::explicitLabels({""}), Plateau::InvalidLabelException);
    REQUIRE_THROWS_WITH(DatasetPartitioner::explicitLabels({"L", "L", "Q"}), Catch::Contains("row 2"));
}

TEST_CASE("apply yields disjoint subsets covering every row once", "[partitioner]") {
    const Dataset data = TestPredictors::linearDataset(50);
    const auto labels = DatasetPartitioner::randomLabels(data.rowCount(), {0.6, 0.2, 0.2}, 3);
    const PartitionedDataset parts = DatasetPartitioner::apply(data, labels);

    REQUIRE(parts.learn.rowCount() == 30);
    REQUIRE(parts.validation.rowCount() == 10);
    REQUIRE(parts.test.rowCount() == 10);

    std::multiset<std::string> ids;
    for (const Dataset* part : {&parts.learn, &parts.validation, &parts.test}) {
        ids.insert(part->rowIds().begin(), part->rowIds().end());
    }
    REQUIRE(ids.size() == data.rowCount());
    for (const auto& id : data.rowIds()) REQUIRE(ids.count(id) == 1);

    // values travel with their rows
    const std::string& firstLearn = parts.learn.rowId(0);
    for (size_t i = 0; i < data.rowCount(); ++i) {
        if (data.rowId(i) == firstLearn) {
            REQUIRE(parts.learn.inputValue(0, "a") == data.inputValue(i, "a"));
        }
    }
}

TEST_CASE("apply uses attached labels and rejects mismatched label vectors", "[partitioner]") {
    Dataset data = TestPredictors::linearDataset(4);
    REQUIRE_THROWS_AS(DatasetPartitioner::apply(data), Plateau::DatasetException);
    REQUIRE_THROWS_AS(DatasetPartitioner::apply(data, {PartitionLabel::LEARN}), Plateau::DatasetException);

    data.attachLabels({PartitionLabel::TEST, PartitionLabel::LEARN, PartitionLabel::LEARN, PartitionLabel::VALIDATION});
    const PartitionedDataset parts = DatasetPartitioner::apply(data);
    REQUIRE(parts.learn.rowIds() == std::vector<std::string>{"id1", "id2"});
    REQUIRE(parts.validation.rowIds() == std::vector<std::string>{"id3"});
    REQUIRE(parts.test.rowIds() == std::vector<std::string>{"id0"});
}
