// SPDX-License-Identifier: MIT
/**
 * @file rational_fit_test.cc
 * @brief Tests for iterative rational least-squares fitting
 */

#include "interpfit/fitting/rational_fit.hpp"
#include "interpfit/fitting/error_metrics.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <vector>

using namespace interpfit;

TEST(RationalFitConfigTest, DefaultValues) {
    RationalFitConfig config;

    EXPECT_EQ(config.max_iter, 100u);
    EXPECT_DOUBLE_EQ(config.tolerance, 1e-6);
    EXPECT_DOUBLE_EQ(config.denominator_floor, 1e-10);
    EXPECT_DOUBLE_EQ(config.solver.singularity_tol, 1e-10);
}

TEST(RationalFitTest, RecoversExactRational) {
    std::vector<double> x, y;
    for (int i = 0; i <= 7; ++i) {
        const double xi = i;
        x.push_back(xi);
        y.push_back((1.0 + 2.0 * xi) / (1.0 + 0.5 * xi));
    }

    auto fit = fit_rational(x, y, 1, 1);

    ASSERT_TRUE(fit.has_value());
    EXPECT_TRUE(fit->converged);
    EXPECT_LE(fit->iterations, 100u);
    EXPECT_LT(fit->sse, 1e-6);
    EXPECT_EQ(fit->numerator_degree(), 1u);
    EXPECT_EQ(fit->denominator_degree(), 1u);

    EXPECT_DOUBLE_EQ(fit->denominator[0], 1.0);
    EXPECT_NEAR(fit->numerator[0], 1.0, 1e-6);
    EXPECT_NEAR(fit->numerator[1], 2.0, 1e-6);
    EXPECT_NEAR(fit->denominator[1], 0.5, 1e-6);
}

TEST(RationalFitTest, RoundedReciprocalSamples) {
    // 3/(1+x) rounded to three decimals
    std::vector<double> x = {0.5, 1.0, 1.5, 2.0, 2.5, 3.0, 3.5, 4.0};
    std::vector<double> y = {2.0, 1.5, 1.2, 1.0, 0.857, 0.75, 0.667, 0.6};

    auto fit = fit_rational(x, y, 1, 1);

    ASSERT_TRUE(fit.has_value());
    EXPECT_DOUBLE_EQ(fit->denominator[0], 1.0);
    EXPECT_NEAR(fit->numerator[0], 3.0, 0.05);
    EXPECT_NEAR(fit->numerator[1], 0.0, 0.05);
    EXPECT_NEAR(fit->denominator[1], 1.0, 0.05);

    auto metrics = rational_error_metrics(x, y, *fit);
    ASSERT_TRUE(metrics.has_value());
    EXPECT_GT(metrics->r_squared, 0.999);
    EXPECT_LT(metrics->max_error, 5e-3);
}

TEST(RationalFitTest, ZeroDenominatorDegreeIsPolynomialFit) {
    std::vector<double> x = {0.0, 1.0, 2.0, 3.0, 4.0, 5.0};
    std::vector<double> y = {1.0, 3.0, 7.0, 13.0, 21.0, 31.0};

    auto fit = fit_rational(x, y, 2, 0);

    ASSERT_TRUE(fit.has_value());
    EXPECT_TRUE(fit->converged);
    ASSERT_EQ(fit->denominator.size(), 1u);
    EXPECT_DOUBLE_EQ(fit->denominator[0], 1.0);
    EXPECT_NEAR(fit->numerator[0], 1.0, 1e-9);
    EXPECT_NEAR(fit->numerator[1], 1.0, 1e-9);
    EXPECT_NEAR(fit->numerator[2], 1.0, 1e-9);
}

TEST(RationalFitTest, IterationCapReportsNotConverged) {
    std::vector<double> x = {0.5, 1.0, 1.5, 2.0, 2.5, 3.0, 3.5, 4.0};
    std::vector<double> y = {2.0, 1.5, 1.2, 1.0, 0.857, 0.75, 0.667, 0.6};

    auto fit = fit_rational(x, y, 1, 1, RationalFitConfig{.max_iter = 1});

    ASSERT_TRUE(fit.has_value());
    EXPECT_FALSE(fit->converged);
    EXPECT_EQ(fit->iterations, 1u);
}

TEST(RationalFitTest, InsufficientPoints) {
    std::vector<double> x = {0.0, 1.0};
    std::vector<double> y = {1.0, 2.0};

    auto fit = fit_rational(x, y, 1, 1);

    ASSERT_FALSE(fit.has_value());
    EXPECT_EQ(fit.error().code, FitErrorCode::InsufficientPoints);
    EXPECT_EQ(fit.error().size, 2u);
    EXPECT_EQ(fit.error().index, 3u);
}

TEST(RationalFitTest, MaximalDegreesAreInsufficientNotWrapped) {
    std::vector<double> x = {0.0, 1.0, 2.0, 3.0};
    std::vector<double> y = {1.0, 2.0, 3.0, 4.0};
    constexpr size_t kMaxDegree = std::numeric_limits<size_t>::max();

    auto big_num = fit_rational(x, y, kMaxDegree, 1);
    ASSERT_FALSE(big_num.has_value());
    EXPECT_EQ(big_num.error().code, FitErrorCode::InsufficientPoints);
    EXPECT_EQ(big_num.error().index, kMaxDegree);

    auto big_den = fit_rational(x, y, 1, kMaxDegree);
    ASSERT_FALSE(big_den.has_value());
    EXPECT_EQ(big_den.error().code, FitErrorCode::InsufficientPoints);
    EXPECT_EQ(big_den.error().index, kMaxDegree);

    // num + den + 1 wraps to 4 == n
    auto wrapped = fit_rational(x, y, 4, kMaxDegree - 4);
    ASSERT_FALSE(wrapped.has_value());
    EXPECT_EQ(wrapped.error().code, FitErrorCode::InsufficientPoints);
}

TEST(RationalFitTest, ExactlyEnoughPointsAccepted) {
    // 1/(1+x) through two samples: two unknowns
    std::vector<double> x = {0.0, 1.0};
    std::vector<double> y = {1.0, 0.5};

    auto fit = fit_rational(x, y, 0, 1);

    ASSERT_TRUE(fit.has_value());
    EXPECT_NEAR(fit->numerator[0], 1.0, 1e-6);
    EXPECT_NEAR(fit->denominator[1], 1.0, 1e-6);
}

TEST(RationalFitTest, DenominatorFloorClampsEveryWeight) {
    // With a floor above every |Q| each sample is weighted by 1/floor, so
    // the reweighting is uniform and the second iterate repeats the first
    std::vector<double> x = {0.5, 1.0, 1.5, 2.0, 2.5, 3.0, 3.5, 4.0};
    std::vector<double> y = {2.0, 1.5, 1.2, 1.0, 0.857, 0.75, 0.667, 0.6};

    auto clamped = fit_rational(x, y, 1, 1, RationalFitConfig{.denominator_floor = 10.0});
    auto single = fit_rational(x, y, 1, 1, RationalFitConfig{.max_iter = 1});
    auto reweighted = fit_rational(x, y, 1, 1);

    ASSERT_TRUE(clamped.has_value());
    ASSERT_TRUE(single.has_value());
    ASSERT_TRUE(reweighted.has_value());

    EXPECT_TRUE(clamped->converged);
    EXPECT_EQ(clamped->iterations, 2u);
    EXPECT_NEAR(clamped->numerator[0], single->numerator[0], 1e-9);
    EXPECT_NEAR(clamped->numerator[1], single->numerator[1], 1e-9);
    EXPECT_NEAR(clamped->denominator[1], single->denominator[1], 1e-9);

    // Unclamped reweighting moves away from the first iterate
    EXPECT_GT(std::abs(reweighted->numerator[0] - clamped->numerator[0]), 1e-5);
}

TEST(RationalFitTest, RepeatedAbscissaeAreSingular) {
    std::vector<double> x = {1.0, 1.0, 1.0, 1.0};
    std::vector<double> y = {1.0, 2.0, 3.0, 4.0};

    auto fit = fit_rational(x, y, 1, 1);

    ASSERT_FALSE(fit.has_value());
    EXPECT_EQ(fit.error().code, FitErrorCode::SingularMatrix);
}

TEST(RationalFitTest, PoleOnSampleDuringFitRejected) {
    // The first solve gives Q(x) = 1 - x, which vanishes at the second sample
    std::vector<double> x = {0.0, 1.0};
    std::vector<double> y = {0.0, 5.0};

    auto fit = fit_rational(x, y, 0, 1);

    ASSERT_FALSE(fit.has_value());
    EXPECT_EQ(fit.error().code, FitErrorCode::NearSingularDenominator);
    EXPECT_DOUBLE_EQ(fit.error().value, 1.0);
}

TEST(RationalFitTest, LengthMismatch) {
    std::vector<double> x = {0.0, 1.0, 2.0, 3.0};
    std::vector<double> y = {1.0, 2.0, 3.0};

    auto fit = fit_rational(x, y, 1, 1);

    ASSERT_FALSE(fit.has_value());
    EXPECT_EQ(fit.error().code, FitErrorCode::LengthMismatch);
}

TEST(RationalFitTest, EmptyInput) {
    std::vector<double> empty;

    auto fit = fit_rational(empty, empty, 0, 0);

    ASSERT_FALSE(fit.has_value());
    EXPECT_EQ(fit.error().code, FitErrorCode::EmptyInput);
}

TEST(EvaluateRationalTest, Value) {
    std::vector<double> num = {1.0, 2.0};
    std::vector<double> den = {1.0, 0.5};

    auto v = evaluate_rational(num, den, 2.0);

    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(*v, 2.5);
}

TEST(EvaluateRationalTest, PoleRejected) {
    std::vector<double> num = {1.0};
    std::vector<double> den = {1.0, -1.0};

    auto v = evaluate_rational(num, den, 1.0);

    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().code, FitErrorCode::NearSingularDenominator);
    EXPECT_DOUBLE_EQ(v.error().value, 1.0);
}

TEST(EvaluateRationalTest, ResultOverload) {
    RationalFitResult fit;
    fit.numerator = {0.0, 3.0};
    fit.denominator = {1.0, 1.0};

    auto v = evaluate_rational(fit, 2.0);

    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(*v, 2.0);
}
