#include <catch2/catch.hpp>

#include "ErrorMetrics.h"
#include "PlateauExceptions.h"

#include <cmath>

TEST_CASE("rmse of identical sequences is zero", "[metrics]") {
    REQUIRE(ErrorMetrics::rmse(std::vector<double>{1, 2, 3}, std::vector<double>{1, 2, 3}) == 0.0);
}

TEST_CASE("rmse of a constant offset equals the offset", "[metrics]") {
    REQUIRE(ErrorMetrics::rmse(std::vector<double>{1, 2, 3}, std::vector<double>{2, 3, 4}) == Approx(1.0));
    REQUIRE(ErrorMetrics::rmse(std::vector<double>{0, 0}, std::vector<double>{3, 4}) == Approx(std::sqrt(12.5)));
}

TEST_CASE("metrics reject mismatched and empty inputs", "[metrics]") {
    const std::vector<double> three{1, 2, 3};
    const std::vector<double> two{1, 2};
    const std::vector<double> none;

    REQUIRE_THROWS_AS(ErrorMetrics::rmse(three, two), Plateau::DimensionMismatchException);
    REQUIRE_THROWS_AS(ErrorMetrics::meanAbsoluteError(two, three), Plateau::DimensionMismatchException);
    REQUIRE_THROWS_AS(ErrorMetrics::medianAbsoluteError(three, two), Plateau::DimensionMismatchException);
    REQUIRE_THROWS_AS(ErrorMetrics::rSquared(three, two), Plateau::DimensionMismatchException);

    REQUIRE_THROWS_AS(ErrorMetrics::rmse(none, none), Plateau::EmptyInputException);
    REQUIRE_THROWS_AS(ErrorMetrics::rmse(three, none), Plateau::EmptyInputException);
    REQUIRE_THROWS_AS(ErrorMetrics::meanAbsoluteError(none, none), Plateau::EmptyInputException);
    REQUIRE_THROWS_AS(ErrorMetrics::rSquared(none, none), Plateau::EmptyInputException);
}

TEST_CASE("mean and median absolute error", "[metrics]") {
    const std::vector<double> predicted{1, 5, 2, 10};
    const std::vector<double> actual{2, 3, 2, 4};
    // |errors| = 1, 2, 0, 6
    REQUIRE(ErrorMetrics::meanAbsoluteError(predicted, actual) == Approx(2.25));
    REQUIRE(ErrorMetrics::medianAbsoluteError(predicted, actual) == Approx(1.5));
    REQUIRE(ErrorMetrics::medianAbsoluteError(std::vector<double>{0, 0, 9}, std::vector<double>{1, 3, 0}) == Approx(3.0));
}

TEST_CASE("r-squared", "[metrics]") {
    SECTION("perfect prediction") {
        REQUIRE(ErrorMetrics::rSquared(std::vector<double>{1, 2, 3}, std::vector<double>{1, 2, 3}) == Approx(1.0));
    }
    SECTION("predicting the mean scores zero") {
        REQUIRE(ErrorMetrics::rSquared(std::vector<double>{2, 2, 2}, std::vector<double>{1, 2, 3}) == Approx(0.0));
    }
    SECTION("constant actual values with exact prediction is defined as one") {
        REQUIRE(ErrorMetrics::rSquared(std::vector<double>{5, 5}, std::vector<double>{5, 5}) == 1.0);
    }
    SECTION("constant actual values with residual is undefined") {
        REQUIRE_THROWS_AS(ErrorMetrics::rSquared(std::vector<double>{5, 6}, std::vector<double>{5, 5}),
                          Plateau::UndefinedMetricException);
    }
}

TEST_CASE("matrix overloads cover every element", "[metrics]") {
    const ErrorMetrics::Matrix predicted{{1, 2}, {3, 4}};
    const ErrorMetrics::Matrix actual{{2, 3}, {4, 5}};
    REQUIRE(ErrorMetrics::rmse(predicted, actual) == Approx(1.0));
    REQUIRE(ErrorMetrics::meanAbsoluteError(predicted, actual) == Approx(1.0));

    const ErrorMetrics::Matrix ragged{{1, 2}, {3}};
    REQUIRE_THROWS_AS(ErrorMetrics::rmse(ragged, actual), Plateau::DimensionMismatchException);
    REQUIRE_THROWS_AS(ErrorMetrics::rmse(ErrorMetrics::Matrix{{1, 2}}, actual), Plateau::DimensionMismatchException);
}

TEST_CASE("summarize leaves r-squared empty when undefined", "[metrics]") {
    const MetricSummary defined = ErrorMetrics::summarize({{1}, {2}, {3}}, {{1}, {2}, {4}});
    REQUIRE(defined.rSquared.has_value());
    REQUIRE(defined.medianAbsoluteError == Approx(0.0));

    const MetricSummary undefined = ErrorMetrics::summarize({{1}, {2}}, {{3}, {3}});
    REQUIRE_FALSE(undefined.rSquared.has_value());
    REQUIRE(undefined.rmse == Approx(std::sqrt(2.5)));
}
